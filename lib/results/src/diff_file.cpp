#include "diffdb/results/diff_file.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace diffdb::results {

Result<OpenMode> parse_open_mode(std::string_view permission) {
    if (permission == "ro") return OpenMode::ReadOnly;
    if (permission == "rw") return OpenMode::ReadWrite;
    return std::unexpected(invalid_argument_error(
        std::format("invalid permission '{}', expected 'ro' or 'rw'", permission)));
}

DiffFile::DiffFile()
    : loader_(db_)
    , writer_(db_)
{}

DiffFile::~DiffFile() {
    close();
}

Result<std::unique_ptr<DiffFile>> DiffFile::open(
    const std::filesystem::path& path,
    OpenMode mode,
    const LoadProgressCallback& callback
) {
    auto file = std::unique_ptr<DiffFile>(new DiffFile());

    auto flags = mode == OpenMode::ReadOnly ? persistence::OpenFlags::ReadOnly
                                            : persistence::OpenFlags::ReadWrite;
    DIFFDB_TRY_VOID(file->db_.open(path.string(), flags));

    file->path_ = path;
    file->mode_ = mode;

    if (mode == OpenMode::ReadOnly) {
        DIFFDB_TRY_VOID(file->loader_.load(callback));
        spdlog::info("Opened '{}': {} function matches, similarity {:.3f}",
                     path.string(), file->loader_.primary_function_matches().size(),
                     file->loader_.metadata().similarity);
    } else {
        spdlog::info("Opened '{}' for writing", path.string());
    }

    return file;
}

Result<std::unique_ptr<DiffFile>> DiffFile::open(
    const std::filesystem::path& path,
    std::string_view permission
) {
    auto mode = DIFFDB_TRY(parse_open_mode(permission));
    return open(path, mode);
}

Result<std::unique_ptr<DiffFile>> DiffFile::create(
    const std::filesystem::path& path,
    const ResultInfo& info
) {
    // Start from an empty file
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return std::unexpected(database_error(
            std::format("Cannot truncate '{}': {}", path.string(), ec.message())));
    }

    auto file = std::unique_ptr<DiffFile>(new DiffFile());
    DIFFDB_TRY_VOID(file->db_.open(path.string(), persistence::OpenFlags::ReadWriteCreate));

    file->path_ = path;
    file->mode_ = OpenMode::ReadWrite;

    DIFFDB_TRY_VOID(file->writer_.install_schema());
    DIFFDB_TRY_VOID(file->writer_.create_result(info));
    DIFFDB_TRY_VOID(file->writer_.commit());

    spdlog::info("Created result file '{}' (version '{}')", path.string(), info.version);
    return file;
}

void DiffFile::close() {
    db_.close();
}

} // namespace diffdb::results
