#pragma once

#include <string>
#include <vector>

#include "transfer/chunk.hpp"

// Side file listing the chunks that failed terminally in the latest pass.
// The file exists exactly when such chunks are pending; it holds a JSON array
// of {"index","start","end"} objects and is replaced wholesale on every save.
class failure_ledger {
public:
    explicit failure_ledger(std::string path);

    // Throws transfer_error(filesystem) when the file cannot be written.
    void save(const std::vector<chunk>& chunks) const;

    // Empty when the file is missing. Throws transfer_error(ledger_corrupt)
    // when it exists but is not a valid chunk list.
    std::vector<chunk> load() const;

    // Deletes the file if present. Throws transfer_error(filesystem).
    void clear() const;

    bool exists() const;

    const std::string& path() const {
        return m_path;
    }

private:
    std::string m_path;
};
