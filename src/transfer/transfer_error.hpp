#pragma once

#include <stdexcept>
#include <string>

enum class error_kind {
    transient,         // one HTTP attempt failed; retryable
    retries_exhausted, // every attempt of a chunk or whole-file download failed
    ledger_corrupt,    // failure ledger exists but cannot be parsed
    probe_failed,      // total size or range support could not be determined
    filesystem,        // directory, open, write or delete failure
    cancelled,
};

inline const char* to_string(error_kind kind) {
    switch (kind) {
    case error_kind::transient:
        return "transient";
    case error_kind::retries_exhausted:
        return "retries_exhausted";
    case error_kind::ledger_corrupt:
        return "ledger_corrupt";
    case error_kind::probe_failed:
        return "probe_failed";
    case error_kind::filesystem:
        return "filesystem";
    case error_kind::cancelled:
        return "cancelled";
    }
    return "unknown";
}

class transfer_error : public std::runtime_error {
public:
    transfer_error(error_kind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    error_kind kind() const noexcept {
        return m_kind;
    }

    bool retryable() const noexcept {
        return m_kind == error_kind::transient;
    }

    bool cancelled() const noexcept {
        return m_kind == error_kind::cancelled;
    }

private:
    error_kind m_kind;
};
