#pragma once
#include "cli_options.hpp"
#include "../destination/share_client.hpp"
#include "../source/object_store.hpp"
#include "../transfer/cancellation_token.hpp"

// process exit status: 0 ok, 1 anything else (cancellation included)
int exitCodeFor(const Result<void>& outcome);

// session setup, size lookup, transfer, teardown and ETag check against the
// given collaborators
Result<void> executeTransfer(ObjectStore& source, ShareClient& share, const TransferCommandOptions& opts,
                             const Credentials& credentials, const CancellationToken& cancel);

// builds the S3 and share clients from opts and runs executeTransfer
Result<void> runTransferCommand(const TransferCommandOptions& opts, const Credentials& credentials,
                                const CancellationToken& cancel);
