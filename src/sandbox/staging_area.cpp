#include "sandbox/staging_area.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandgrade::sandbox {
namespace fs = std::filesystem;

StagingArea::StagingArea(const fs::path& root) {
    const auto base = root.empty() ? DefaultRoot() : root;
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        throw core::RuntimeFault("cannot create staging root " + base.string() + ": " + ec.message());
    }
    root_ = base / ("sandgrade-" + utils::RandomHex());
    if (!fs::create_directory(root_, ec) || ec) {
        throw core::RuntimeFault("cannot create staging dir " + root_.string() + ": " + ec.message());
    }
    fs::permissions(root_, fs::perms::owner_all, fs::perm_options::replace, ec);
    fs::create_directory(InputDir(), ec);
    if (!ec) {
        fs::create_directory(OutputDir(), ec);
    }
    if (ec) {
        const auto message = ec.message();
        fs::remove_all(root_, ec);
        throw core::RuntimeFault("cannot prepare staging dir " + root_.string() + ": " + message);
    }
}

StagingArea::~StagingArea() {
    std::error_code ec;
    // Restore write permission so remove_all can unlink the sealed inputs.
    fs::permissions(InputDir(), fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(root_, ec);
    if (ec) {
        utils::LogError("runner", "staging cleanup failed",
                        {{"path", root_.string()}, {"error", ec.message()}});
    }
}

void StagingArea::WriteInput(const std::string& name, const std::string& content) {
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw core::RuntimeFault("invalid staging file name '" + name + "'");
    }
    const auto path = InputDir() / name;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw core::RuntimeFault("cannot write staging file " + path.string());
    }
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
    output.close();
    if (!output) {
        throw core::RuntimeFault("short write on staging file " + path.string());
    }
}

void StagingArea::Seal() {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(InputDir(), ec)) {
        fs::permissions(entry.path(),
                        fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                        fs::perm_options::replace, ec);
        if (ec) {
            break;
        }
    }
    if (!ec) {
        fs::permissions(InputDir(),
                        fs::perms::owner_read | fs::perms::owner_exec |
                        fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace, ec);
    }
    if (!ec) {
        fs::permissions(OutputDir(), fs::perms::all, fs::perm_options::replace, ec);
    }
    if (ec) {
        throw core::RuntimeFault("cannot seal staging dir " + root_.string() + ": " + ec.message());
    }
}

std::optional<std::string> StagingArea::ReadOutput(const std::string& name, std::size_t max_bytes) const {
    const auto path = OutputDir() / name;
    std::error_code ec;
    // A symlink planted by the sandbox must not make us read host files.
    const auto status = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec || size > max_bytes) {
        utils::LogWarn("runner", "reporter output rejected",
                       {{"path", path.string()}, {"size", std::to_string(size)}});
        return std::nullopt;
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

fs::path StagingArea::DefaultRoot() {
    return fs::temp_directory_path() / "sandgrade";
}

}  // namespace sandgrade::sandbox
