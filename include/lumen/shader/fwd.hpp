#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for lumen_shader module

#include <memory>

namespace lumen_shader {

struct ShaderVariant;
struct ShaderTemplate;
struct ShaderVariantKey;
struct ShaderCacheConfig;
struct ShaderMetrics;
struct ShaderCacheStats;

class ShaderLibrary;
class Preprocessor;
class ShaderProgram;
class ShaderCache;

using ProgramPtr = std::shared_ptr<ShaderProgram>;

} // namespace lumen_shader
