#pragma once

#include <vector>

#include "transfer/chunk.hpp"
#include "transfer/chunk_fetcher.hpp"
#include "transfer/download_config.hpp"
#include "transfer/failure_ledger.hpp"
#include "transfer/target_file.hpp"
#include "util/cancellation.hpp"
#include "util/logger.hpp"

// Downloads a chunk list with at most `max_concurrency` fetches in flight.
//
// Every dispatched chunk runs to completion (success or exhausted retries)
// before the outcome is decided; a failing chunk never stops its siblings.
// Failed chunks, plus chunks left undispatched after a cancellation, are
// written to the failure ledger and one representative error is thrown
// (a cancellation wins over other errors). With no failures any stale ledger
// is removed.
class multipart_transfer {
public:
    multipart_transfer(const download_config& config, const chunk_fetcher& fetcher,
                       const failure_ledger& ledger, const cancellation_source& cancel,
                       logger& log);

    void download(target_file& file, const std::vector<chunk>& chunks);

private:
    const download_config& m_config;
    const chunk_fetcher& m_fetcher;
    const failure_ledger& m_ledger;
    const cancellation_source& m_cancel;
    logger& m_log;
};
