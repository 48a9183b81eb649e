#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "transfer_executor.hpp"
#include "transport.hpp"

/**
 * Build per-request settings from the invocation configuration.
 */
RequestOptions makeRequestOptions(const DownloadConfig &config);

/**
 * Build executor settings (freshness, retries, parallelism) from the configuration.
 */
ExecutorOptions makeExecutorOptions(const DownloadConfig &config);

/**
 * Transport factory creating libcurl-backed HttpClient instances.
 */
TransportFactory httpTransportFactory();

/**
 * Run one download invocation: resolve sources to units and process them all.
 *
 * The caller owns the cancellation token and may cancel it from another
 * thread; a configured timeout is applied to it as a deadline.
 *
 * @param config What to download and how
 * @param cancellation Invocation-wide cancellation
 * @param transportFactory Creates one transport per worker
 * @return Per-unit reports; check succeeded() and describeFailures()
 * @throws ConfigurationError before any network request if the configuration is invalid
 */
InvocationResult runDownload(const DownloadConfig &config,
                             CancellationToken &cancellation,
                             const TransportFactory &transportFactory = httpTransportFactory());
