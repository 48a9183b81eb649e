#include "freshness.hpp"
#include "cancellation.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <sys/stat.h>
#include <sys/time.h>

#include <fmt/core.h>

FreshnessEvaluator::FreshnessEvaluator(FreshnessPolicy policy, RequestOptions options, bool quiet)
    : policy_(policy), options_(std::move(options)), quiet_(quiet)
{
}

FreshnessDecision FreshnessEvaluator::evaluate(const TransferUnit &unit,
                                               Transport &transport,
                                               const CancellationToken &cancellation) const
{
    if (policy_.overwrite)
    {
        return FreshnessDecision::Stale;
    }

    std::error_code ec;
    if (!std::filesystem::exists(unit.destination, ec))
    {
        return FreshnessDecision::Stale;
    }

    if (!policy_.onlyIfModified)
    {
        // The file is there and we were told not to overwrite it
        return FreshnessDecision::UpToDate;
    }

    ProbeConditions conditions;
    conditions.ifModifiedSince = modificationTime(unit.destination);
    conditions.ifNoneMatch = readCachedEtag(unit.destination);

    ProbeResult probe = transport.probe(unit.source, conditions, options_, cancellation);

    switch (probe.status)
    {
    case ProbeStatus::NotModified:
        return FreshnessDecision::UpToDate;
    case ProbeStatus::Modified:
        return FreshnessDecision::Stale;
    case ProbeStatus::Failed:
        break;
    }

    // Never skip on uncertainty
    if (!quiet_)
    {
        fmt::print(stderr, "Warning: Could not check whether {} was modified ({}). Downloading it again.\n",
                   unit.source, probe.cause);
    }
    return FreshnessDecision::Stale;
}

std::filesystem::path FreshnessEvaluator::etagPath(const std::filesystem::path &destination)
{
    std::filesystem::path sidecar = destination;
    sidecar += ".etag";
    return sidecar;
}

std::optional<std::string> FreshnessEvaluator::readCachedEtag(const std::filesystem::path &destination)
{
    std::ifstream in(etagPath(destination));
    if (!in)
    {
        return std::nullopt;
    }

    std::string etag;
    std::getline(in, etag);
    if (etag.empty())
    {
        return std::nullopt;
    }
    return etag;
}

bool FreshnessEvaluator::storeEtag(const std::filesystem::path &destination,
                                   const std::optional<std::string> &etag)
{
    std::filesystem::path sidecar = etagPath(destination);

    if (!etag)
    {
        std::error_code ec;
        std::filesystem::remove(sidecar, ec);
        return !ec;
    }

    std::ofstream out(sidecar, std::ios::trunc);
    out << *etag << '\n';
    out.close();
    return !out.fail();
}

std::optional<std::time_t> FreshnessEvaluator::modificationTime(const std::filesystem::path &path)
{
    // std::filesystem's file_time_type has no portable epoch in C++17
    struct stat info;
    if (::stat(path.c_str(), &info) != 0)
    {
        return std::nullopt;
    }
    return info.st_mtime;
}

bool FreshnessEvaluator::setModificationTime(const std::filesystem::path &path, std::time_t time)
{
    struct timeval times[2];
    times[0].tv_sec = time;
    times[0].tv_usec = 0;
    times[1] = times[0];
    return ::utimes(path.c_str(), times) == 0;
}
