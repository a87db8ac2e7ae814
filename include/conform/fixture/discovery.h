#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::fixture {

enum class FixtureKind { TreeConstruction, Tokenizer, Serializer };

// "tree-construction", "tokenizer" or "serializer": both the suite name and
// the subdirectory searched under the tests root.
const char* kind_name(FixtureKind kind);
std::string_view kind_extension(FixtureKind kind);

// Collects every file of the given kind below <root>/<kind_name(kind)>,
// sorted. A missing subdirectory yields an empty list. Directory I/O errors
// throw std::filesystem::filesystem_error.
std::vector<std::filesystem::path> discover_fixture_files(const std::filesystem::path& root,
                                                          FixtureKind kind);

std::vector<std::filesystem::path> discover_tree_construction_files(const std::filesystem::path& root);
std::vector<std::filesystem::path> discover_tokenizer_files(const std::filesystem::path& root);
std::vector<std::filesystem::path> discover_serializer_files(const std::filesystem::path& root);

// `file` relative to `root`, or `file` unchanged when it is not below it.
std::filesystem::path relative_to_root(const std::filesystem::path& file,
                                       const std::filesystem::path& root);

// Whole-file read. On failure returns std::nullopt and describes the problem
// in `error` when given.
std::optional<std::string> read_fixture_file(const std::filesystem::path& path,
                                             std::string* error = nullptr);

} // namespace conform::fixture
