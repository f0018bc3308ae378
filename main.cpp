#include "cli/cli_options.hpp"
#include "cli/commands.hpp"
#include "cli/console.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {

    if(argc<2){
        std::cerr << usageText();
        return 1;
    }

    std::string mode=argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (mode == "help" || mode == "--help" || mode == "-h") {
        std::cout << usageText();
        return 0;
    }

    CancellationToken cancel;
    installSignalHandlers(cancel);

    Result<void> outcome = Result<void>::Ok();
    if(mode=="transfer"){
        Result<TransferCommandOptions> opts = parseTransferOptions(args);
        if (!opts.success) {
            std::cerr << opts.message << "\n" << usageText();
            return 1;
        }
        Logger::setLevel(opts.data.logLevel);
        Credentials creds = promptCredentials(std::cin, std::cout, "SMB Authentication Required");
        outcome = runTransferCommand(opts.data, creds, cancel);
        if (outcome.success) Logger::info("Main", "=== SUCCESS === File successfully transferred from S3 to the share");
    }else{
        std::cerr << "Unknown mode '" << mode << "'\n" << usageText();
        return 1;
    }

    if (!outcome.success) {
        Logger::error("Main", mode + " failed: " + outcome.describe());
    }
    return exitCodeFor(outcome);
}
