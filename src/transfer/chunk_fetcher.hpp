#pragma once

#include "transfer/chunk.hpp"
#include "transfer/download_config.hpp"
#include "transfer/target_file.hpp"
#include "util/cancellation.hpp"
#include "util/logger.hpp"

// Downloads one chunk with a `Range: bytes=start-end` GET and writes the body
// at the chunk's own offsets. Holds no per-chunk state, so one instance can
// serve every worker thread.
class chunk_fetcher {
public:
    chunk_fetcher(const download_config& config, const cancellation_source& cancel, logger& log);

    // fetch_once under the configured retry policy. Throws
    // transfer_error(retries_exhausted) when every attempt failed, or the
    // filesystem/cancelled error that ended the attempts early.
    void fetch(target_file& file, const chunk& c) const;

    // One attempt. Anything but `206 Partial Content`, a transport error or a
    // body shorter than the chunk throws transfer_error(transient). Bytes past
    // the chunk end are dropped and the transfer is closed.
    void fetch_once(target_file& file, const chunk& c) const;

private:
    const download_config& m_config;
    const cancellation_source& m_cancel;
    logger& m_log;
};
