#include "core/state/LedgerStorageJson.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace tradesync {
namespace core {

LedgerStorageJson::LedgerStorageJson(std::filesystem::path file_path, utils::ClockFn clock)
    : file_path_(std::move(file_path))
    , clock_(std::move(clock)) {}

std::optional<nlohmann::json> LedgerStorageJson::load() {
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + file_path_.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string text = buffer.str();

    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw LedgerCorruptError(file_path_.string() + ": " + e.what());
    }
    if (!raw.is_object()) {
        throw LedgerCorruptError(file_path_.string() + ": top level is not an object");
    }
    return raw;
}

bool LedgerStorageJson::save(const nlohmann::json& document) {
    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << document.dump(2);
        out.flush();
        if (!out.good()) {
            return false;
        }
    }

    ec.clear();
    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // Some filesystems refuse rename over an existing file; fall back to copy+remove.
    ec.clear();
    std::filesystem::copy_file(
        tmp_path,
        file_path_,
        std::filesystem::copy_options::overwrite_existing,
        ec
    );
    if (ec) {
        return false;
    }

    std::filesystem::remove(tmp_path, ec);
    return true;
}

std::string LedgerStorageJson::quarantine() {
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        return "";
    }

    auto target = file_path_;
    target += ".corrupt-" + std::to_string(clock_());

    std::filesystem::rename(file_path_, target, ec);
    if (ec) {
        return "";
    }
    return target.string();
}

} // namespace core
} // namespace tradesync
