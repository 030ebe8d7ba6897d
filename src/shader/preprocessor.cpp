/// @file preprocessor.cpp
/// @brief Preprocessor implementation

#include <lumen/shader/preprocessor.hpp>
#include <lumen/shader/library.hpp>

#include <algorithm>
#include <regex>
#include <sstream>

namespace lumen_shader {

using lumen_core::Err;
using lumen_core::Ok;
using lumen_core::Result;
using lumen_core::ShaderError;

namespace {

/// One open conditional block
struct Block {
    bool parent_active = true;
    bool taken = false;          // Current branch of a resolved block is live
    bool passthrough = false;    // `#if` family left for the driver
    bool seen_else = false;
    std::size_t line = 0;
};

/// Directive keyword and its argument, if the line is a directive
bool parse_directive(const std::string& line, std::string& keyword, std::string& argument) {
    static const std::regex directive_regex(R"(^\s*#\s*([A-Za-z_]+)\s*(.*?)\s*$)");
    std::smatch match;
    if (!std::regex_match(line, match, directive_regex)) {
        return false;
    }
    keyword = match[1].str();
    argument = match[2].str();
    return true;
}

/// First identifier of a directive argument
std::string first_word(const std::string& argument) {
    auto end = argument.find_first_of(" \t(");
    return argument.substr(0, end);
}

std::string line_context(std::size_t line) {
    return "line " + std::to_string(line);
}

std::string include_chain(const std::vector<std::string>& stack, const std::string& name) {
    std::string chain;
    for (const auto& entry : stack) {
        chain += entry + " -> ";
    }
    return chain + name;
}

} // anonymous namespace

Result<std::string> Preprocessor::process(const std::string& source, const DefineMap& defines) const {
    std::set<std::string> defined;
    for (const auto& [name, value] : defines) {
        defined.insert(name);
    }

    IncludeState includes;
    auto resolved = resolve(source, defined, &includes);
    if (!resolved) {
        return resolved;
    }

    return Ok(inject_defines(*resolved, defines));
}

Result<std::string> Preprocessor::resolve_includes(const std::string& source) const {
    std::set<std::string> included;
    std::vector<std::string> stack;
    return expand(source, included, stack);
}

Result<std::string> Preprocessor::expand(const std::string& source,
                                         std::set<std::string>& included,
                                         std::vector<std::string>& stack) const {
    static const std::regex include_regex(R"(^\s*#\s*include\s+["<]([^">]+)[">]\s*$)");

    std::string result;
    std::istringstream stream(source);
    std::string line;

    while (std::getline(stream, line)) {
        std::smatch match;
        if (!std::regex_match(line, match, include_regex)) {
            result += line + "\n";
            continue;
        }

        const std::string name = match[1].str();
        if (std::find(stack.begin(), stack.end(), name) != stack.end()) {
            return Err<std::string>(ShaderError::preprocess_failed("include cycle: " + include_chain(stack, name)));
        }
        if (included.count(name) > 0) {
            continue;
        }

        const std::string* chunk = m_library.find_chunk(name);
        if (!chunk) {
            return Err<std::string>(ShaderError::include_not_found(name));
        }
        included.insert(name);

        stack.push_back(name);
        auto expanded = expand(*chunk, included, stack);
        stack.pop_back();
        if (!expanded) {
            return expanded;
        }

        result += *expanded;
    }

    return Ok(std::move(result));
}

Result<std::string> Preprocessor::include_chunk(const std::string& name,
                                                std::set<std::string>& defined,
                                                IncludeState& includes) const {
    auto& stack = includes.stack;
    if (std::find(stack.begin(), stack.end(), name) != stack.end()) {
        return Err<std::string>(ShaderError::preprocess_failed("include cycle: " + include_chain(stack, name)));
    }
    if (includes.included.count(name) > 0) {
        return Ok(std::string{});
    }

    const std::string* chunk = m_library.find_chunk(name);
    if (!chunk) {
        return Err<std::string>(ShaderError::include_not_found(name));
    }
    includes.included.insert(name);

    stack.push_back(name);
    auto expanded = resolve(*chunk, defined, &includes);
    stack.pop_back();
    return expanded;
}

Result<std::string> Preprocessor::resolve_conditionals(const std::string& source,
                                                       const DefineMap& defines) const {
    std::set<std::string> defined;
    for (const auto& [name, value] : defines) {
        defined.insert(name);
    }
    return resolve(source, defined, nullptr);
}

Result<std::string> Preprocessor::resolve(const std::string& source,
                                          std::set<std::string>& defined,
                                          IncludeState* includes) const {
    static const std::regex include_target_regex(R"(^["<]([^">]+)[">]$)");

    std::vector<Block> blocks;
    auto active = [&blocks]() {
        if (blocks.empty()) {
            return true;
        }
        const auto& top = blocks.back();
        return top.passthrough ? top.parent_active : (top.parent_active && top.taken);
    };

    std::string result;
    std::istringstream stream(source);
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;

        std::string keyword;
        std::string argument;
        if (!parse_directive(line, keyword, argument)) {
            if (active()) {
                result += line + "\n";
            }
            continue;
        }

        if (keyword == "ifdef" || keyword == "ifndef") {
            const std::string symbol = first_word(argument);
            if (symbol.empty()) {
                return Err<std::string>(ShaderError::preprocess_failed(
                    "#" + keyword + " without a symbol at " + line_context(line_number)));
            }
            const bool is_defined = defined.count(symbol) > 0;
            Block block;
            block.parent_active = active();
            block.taken = keyword == "ifdef" ? is_defined : !is_defined;
            block.line = line_number;
            blocks.push_back(block);
        } else if (keyword == "if") {
            Block block;
            block.parent_active = active();
            block.passthrough = true;
            block.line = line_number;
            if (block.parent_active) {
                result += line + "\n";
            }
            blocks.push_back(block);
        } else if (keyword == "elif") {
            if (blocks.empty()) {
                return Err<std::string>(ShaderError::preprocess_failed(
                    "#elif without #if at " + line_context(line_number)));
            }
            if (!blocks.back().passthrough) {
                return Err<std::string>(ShaderError::preprocess_failed(
                    "#elif cannot follow #ifdef/#ifndef at " + line_context(line_number)));
            }
            if (blocks.back().parent_active) {
                result += line + "\n";
            }
        } else if (keyword == "else") {
            if (blocks.empty()) {
                return Err<std::string>(ShaderError::preprocess_failed(
                    "#else without #if at " + line_context(line_number)));
            }
            auto& block = blocks.back();
            if (block.seen_else) {
                return Err<std::string>(ShaderError::preprocess_failed(
                    "duplicate #else at " + line_context(line_number)));
            }
            block.seen_else = true;
            if (block.passthrough) {
                if (block.parent_active) {
                    result += line + "\n";
                }
            } else {
                block.taken = !block.taken;
            }
        } else if (keyword == "endif") {
            if (blocks.empty()) {
                return Err<std::string>(ShaderError::preprocess_failed(
                    "#endif without #if at " + line_context(line_number)));
            }
            const Block block = blocks.back();
            blocks.pop_back();
            if (block.passthrough && block.parent_active) {
                result += line + "\n";
            }
        } else {
            if (!active()) {
                continue;
            }
            std::smatch target;
            if (includes && keyword == "include" && std::regex_match(argument, target, include_target_regex)) {
                auto expanded = include_chunk(target[1].str(), defined, *includes);
                if (!expanded) {
                    return expanded;
                }
                result += *expanded;
                continue;
            }
            if (keyword == "define") {
                const std::string symbol = first_word(argument);
                if (!symbol.empty()) {
                    defined.insert(symbol);
                }
            } else if (keyword == "undef") {
                defined.erase(first_word(argument));
            }
            result += line + "\n";
        }
    }

    if (!blocks.empty()) {
        return Err<std::string>(ShaderError::preprocess_failed(
            "unterminated conditional opened at " + line_context(blocks.back().line)));
    }

    return Ok(std::move(result));
}

std::string Preprocessor::inject_defines(const std::string& source, const DefineMap& defines) {
    std::string header;
    for (const auto& [name, value] : defines) {
        header += "#define " + name + " " + define_value_string(value) + "\n";
    }
    if (header.empty()) {
        return source;
    }

    // #version must stay the first directive
    static const std::regex version_regex(R"(^\s*#\s*version\b)");
    std::size_t pos = 0;
    while (pos < source.size()) {
        std::size_t end = source.find('\n', pos);
        std::string line = source.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        const bool blank = line.find_first_not_of(" \t\r") == std::string::npos;
        if (!blank) {
            if (std::regex_search(line, version_regex)) {
                std::size_t insert_at = end == std::string::npos ? source.size() : end + 1;
                std::string result = source.substr(0, insert_at);
                if (end == std::string::npos) {
                    result += "\n";
                }
                return result + header + source.substr(insert_at);
            }
            break;
        }
        if (end == std::string::npos) {
            break;
        }
        pos = end + 1;
    }

    return header + source;
}

} // namespace lumen_shader
