#pragma once

/// @file preprocessor.hpp
/// @brief Variant source generation: defines, includes and conditional blocks
///
/// Processing order:
/// 1. One pass over the source in line order:
///    - `#ifdef` / `#ifndef` / `#else` / `#endif` resolved against the
///      variant defines plus any `#define` / `#undef` met in active code;
///      other `#if` forms are left for the driver
///    - `#include "name"` / `#include <name>` in active code expanded from
///      the library through the same pass; each chunk is included once
///      and cycles are errors. Includes in stripped blocks are not counted.
/// 2. Variant defines emitted as `#define NAME VALUE`, right after the
///    `#version` line when there is one

#include "fwd.hpp"
#include "types.hpp"
#include <lumen/core/error.hpp>

#include <set>
#include <string>
#include <vector>

namespace lumen_shader {

class Preprocessor {
public:
    explicit Preprocessor(const ShaderLibrary& library) : m_library(library) {}

    /// Produce the final source for one stage of a variant
    [[nodiscard]] lumen_core::Result<std::string> process(const std::string& source,
                                                          const DefineMap& defines) const;

    /// Expand includes only
    [[nodiscard]] lumen_core::Result<std::string> resolve_includes(const std::string& source) const;

    /// Resolve conditional blocks only
    [[nodiscard]] lumen_core::Result<std::string> resolve_conditionals(const std::string& source,
                                                                       const DefineMap& defines) const;

    /// Insert `#define` lines after `#version` (or at the top)
    [[nodiscard]] static std::string inject_defines(const std::string& source, const DefineMap& defines);

private:
    struct IncludeState {
        std::set<std::string> included;
        std::vector<std::string> stack;
    };

    [[nodiscard]] lumen_core::Result<std::string> expand(const std::string& source,
                                                         std::set<std::string>& included,
                                                         std::vector<std::string>& stack) const;

    /// Conditional pass; expands active includes when `includes` is set
    [[nodiscard]] lumen_core::Result<std::string> resolve(const std::string& source,
                                                          std::set<std::string>& defined,
                                                          IncludeState* includes) const;

    [[nodiscard]] lumen_core::Result<std::string> include_chunk(const std::string& name,
                                                                std::set<std::string>& defined,
                                                                IncludeState& includes) const;

    const ShaderLibrary& m_library;
};

} // namespace lumen_shader
