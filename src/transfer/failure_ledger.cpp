#include "transfer/failure_ledger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <nlohmann/json.hpp>

#include "transfer/transfer_error.hpp"

void to_json(nlohmann::json& j, const chunk& c) {
    j = nlohmann::json{{"index", c.index}, {"start", c.start}, {"end", c.end}};
}

void from_json(const nlohmann::json& j, chunk& c) {
    if (!j.is_object()) {
        throw std::invalid_argument("chunk record is not an object");
    }
    for (const char* key : {"index", "start", "end"}) {
        if (!j.contains(key) || !j.at(key).is_number_unsigned()) {
            throw std::invalid_argument(std::string("chunk record has no valid '") + key + "'");
        }
    }
    c.index = j.at("index").get<std::uint64_t>();
    c.start = j.at("start").get<std::uint64_t>();
    c.end = j.at("end").get<std::uint64_t>();
    if (c.end < c.start) {
        throw std::invalid_argument("chunk record ends before it starts");
    }
}

failure_ledger::failure_ledger(std::string path) : m_path(std::move(path)) {}

void failure_ledger::save(const std::vector<chunk>& chunks) const {
    std::string data = nlohmann::json(chunks).dump();

    // Write beside the ledger and rename so a crash never leaves half a record
    std::string tmp_path = m_path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw transfer_error(error_kind::filesystem,
                                 "failed to open failed chunks record " + tmp_path);
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file.good()) {
            throw transfer_error(error_kind::filesystem,
                                 "failed to write failed chunks record " + tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::remove(tmp_path.c_str());
        throw transfer_error(error_kind::filesystem,
                             "failed to replace failed chunks record " + m_path + ": " + reason);
    }
}

std::vector<chunk> failure_ledger::load() const {
    if (!exists()) {
        return {};
    }

    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open()) {
        throw transfer_error(error_kind::filesystem,
                             "failed to read failed chunks record file " + m_path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    try {
        auto json = nlohmann::json::parse(contents.str());
        if (!json.is_array()) {
            throw std::invalid_argument("top-level value is not an array");
        }
        return json.get<std::vector<chunk>>();
    } catch (const nlohmann::json::exception& e) {
        throw transfer_error(error_kind::ledger_corrupt,
                             "failed to parse failed chunks record file " + m_path + ": " +
                                 e.what());
    } catch (const std::invalid_argument& e) {
        throw transfer_error(error_kind::ledger_corrupt,
                             "failed to parse failed chunks record file " + m_path + ": " +
                                 e.what());
    }
}

void failure_ledger::clear() const {
    if (std::remove(m_path.c_str()) != 0 && errno != ENOENT) {
        throw transfer_error(error_kind::filesystem, "failed to delete failed chunks record file " +
                                                         m_path + ": " + std::strerror(errno));
    }
}

bool failure_ledger::exists() const {
    struct stat st;
    return ::stat(m_path.c_str(), &st) == 0;
}
