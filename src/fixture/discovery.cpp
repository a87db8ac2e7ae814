#include <conform/fixture/discovery.h>
#include <conform/core/config.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace conform::fixture {

namespace fs = std::filesystem;

const char* kind_name(FixtureKind kind) {
    switch (kind) {
        case FixtureKind::TreeConstruction: return core::config::kTreeConstructionDir;
        case FixtureKind::Tokenizer:        return core::config::kTokenizerDir;
        case FixtureKind::Serializer:       return core::config::kSerializerDir;
    }
    return "unknown";
}

std::string_view kind_extension(FixtureKind kind) {
    if (kind == FixtureKind::TreeConstruction) {
        return core::config::kTreeConstructionExtension;
    }
    return core::config::kJsonFixtureExtension;
}

std::vector<fs::path> discover_fixture_files(const fs::path& root, FixtureKind kind) {
    std::vector<fs::path> files;
    const fs::path dir = root / kind_name(kind);
    if (!fs::is_directory(dir)) {
        return files;
    }

    const std::string_view extension = kind_extension(kind);
    for (const auto& entry : fs::recursive_directory_iterator(
             dir, fs::directory_options::follow_directory_symlink)) {
        if (entry.is_directory()) continue;
        if (entry.path().extension().string() == extension) {
            files.push_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> discover_tree_construction_files(const fs::path& root) {
    return discover_fixture_files(root, FixtureKind::TreeConstruction);
}

std::vector<fs::path> discover_tokenizer_files(const fs::path& root) {
    return discover_fixture_files(root, FixtureKind::Tokenizer);
}

std::vector<fs::path> discover_serializer_files(const fs::path& root) {
    return discover_fixture_files(root, FixtureKind::Serializer);
}

fs::path relative_to_root(const fs::path& file, const fs::path& root) {
    fs::path rel = file.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return file;
    }
    return rel;
}

namespace {

// An ifstream that failed to open does not say why, so ask the filesystem.
std::string open_failure_reason(const fs::path& path) {
    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return std::make_error_code(std::errc::no_such_file_or_directory).message();
    }
    if (ec) {
        return ec.message();
    }
    return std::make_error_code(std::errc::permission_denied).message();
}

} // namespace

std::optional<std::string> read_fixture_file(const fs::path& path, std::string* error) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        if (error) {
            *error = "cannot open " + path.string() + ": " +
                     std::make_error_code(std::errc::is_a_directory).message();
        }
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        if (error) {
            *error = "cannot open " + path.string() + ": " + open_failure_reason(path);
        }
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        if (error) {
            *error = "cannot read " + path.string();
        }
        return std::nullopt;
    }
    return buffer.str();
}

} // namespace conform::fixture
