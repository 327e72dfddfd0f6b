#include "ota/install_receipt.hpp"

#include "io/file_writer.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fwfleet {

using json = nlohmann::json;

std::string InstallReceipt::PathFor(const std::string& target_dir) {
    namespace fs = std::filesystem;
    fs::path target(target_dir);
    while (!target.empty() && !target.has_filename()) target = target.parent_path();
    return (target.parent_path() / ("." + target.filename().string() + ".receipt.json")).string();
}

Result InstallReceipt::Write(const std::string& path, const InstallReceipt& receipt) {
    const json j = {
        {"version", receipt.version},
        {"payload_sha256", receipt.payload_sha256},
        {"tree_sha256", receipt.tree_sha256},
        {"installed_at", receipt.installed_at},
    };
    const std::string text = j.dump(2) + "\n";

    const std::string tmp_path = path + ".tmp";
    FileWriter writer;
    auto r = FileWriter::Open(tmp_path, writer);
    if (!r.ok) return r;

    r = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
    if (r.ok) r = writer.FsyncNow();
    if (r.ok) r = writer.Close();
    if (!r.ok) {
        ::unlink(tmp_path.c_str());
        return r;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(err, "rename receipt: " + std::string(std::strerror(err)));
    }
    return Result::Ok();
}

Result InstallReceipt::Load(const std::string& path, InstallReceipt& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(Errc::NotFound, "no install receipt: " + path);
    }

    json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(Errc::Io, "invalid receipt " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        return Result::Fail(Errc::Io, "receipt must be a JSON object: " + path);
    }

    try {
        out = InstallReceipt{};
        out.version = j.value("version", "");
        out.payload_sha256 = j.value("payload_sha256", "");
        out.tree_sha256 = j.value("tree_sha256", "");
        out.installed_at = j.value("installed_at", "");
    } catch (const json::exception& e) {
        return Result::Fail(Errc::Io, "invalid receipt " + path + ": " + e.what());
    }
    return Result::Ok();
}

} // namespace fwfleet
