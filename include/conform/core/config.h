#ifndef CONFORM_CORE_CONFIG_H
#define CONFORM_CORE_CONFIG_H

#include <cstddef>

namespace conform::core::config {

inline constexpr const char kProgramName[] = "conform";
inline constexpr const char kVersionString[] = "conform 0.1.0";

inline constexpr const char kDefaultTestsRoot[] = "~/html5lib-tests";
inline constexpr std::size_t kDefaultMaxFailures = 20;

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailures = 1;
inline constexpr int kExitUsage = 2;

inline constexpr const char kTreeConstructionDir[] = "tree-construction";
inline constexpr const char kTokenizerDir[] = "tokenizer";
inline constexpr const char kSerializerDir[] = "serializer";

inline constexpr const char kTreeConstructionExtension[] = ".dat";
inline constexpr const char kJsonFixtureExtension[] = ".test";

}  // namespace conform::core::config

#endif  // CONFORM_CORE_CONFIG_H
