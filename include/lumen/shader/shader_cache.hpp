#pragma once

/// @file shader_cache.hpp
/// @brief Compiled program cache keyed by template id and variant
///
/// - get_program() compiles on a miss and returns the cached instance on
///   every later call until the entry is evicted
/// - get_program_async() queues the compile when async compilation is on;
///   the FIFO queue advances one entry per process_compile_queue(1) or
///   update() call, so the render loop never waits on more than one compile
/// - cleanup_cache() evicts idle entries (all of them when forced) and runs
///   on its own interval from update() and whenever memory exceeds the limit

#include "fwd.hpp"
#include "types.hpp"
#include "events.hpp"
#include "library.hpp"
#include "preprocessor.hpp"
#include "program.hpp"

#include <lumen/core/error.hpp>
#include <lumen/core/time.hpp>
#include <lumen/event/event_bus.hpp>
#include <lumen/gpu/device.hpp>

#include <deque>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lumen_shader {

using ProgramResult = lumen_core::Result<ProgramPtr>;
using ProgramFuture = std::shared_future<ProgramResult>;

class ShaderCache {
public:
    ShaderCache(lumen_gpu::IGraphicsDevice& device,
                lumen_event::EventBus& events,
                ShaderCacheConfig config = {},
                ShaderLibrary library = ShaderLibrary::with_builtins(),
                const lumen_core::TimeSource& time = lumen_core::system_time());
    ~ShaderCache();

    ShaderCache(const ShaderCache&) = delete;
    ShaderCache& operator=(const ShaderCache&) = delete;

    // =========================================================================
    // Templates
    // =========================================================================

    /// Store a template, replacing (and evicting) any previous one with the same id
    [[nodiscard]] lumen_core::Result<void> register_template(ShaderTemplate shader_template);

    /// Register every built-in 2D template
    [[nodiscard]] lumen_core::Result<void> register_builtin_templates();

    /// Replace a template's sources; takes effect on the next compile or hot reload
    [[nodiscard]] lumen_core::Result<void> update_template_sources(const std::string& template_id,
                                                                   std::string vertex_source,
                                                                   std::string fragment_source);

    [[nodiscard]] bool has_template(const std::string& template_id) const {
        return m_templates.find(template_id) != m_templates.end();
    }

    [[nodiscard]] const ShaderTemplate* find_template(const std::string& template_id) const;

    [[nodiscard]] ShaderLibrary& library() noexcept { return m_library; }
    [[nodiscard]] const ShaderLibrary& library() const noexcept { return m_library; }

    // =========================================================================
    // Programs
    // =========================================================================

    /// Cached program, compiling on a miss (empty variant selects the first)
    [[nodiscard]] ProgramResult get_program(const std::string& template_id,
                                            const std::string& variant = {});

    /// As get_program, but a miss is queued when async compilation is enabled
    [[nodiscard]] ProgramFuture get_program_async(const std::string& template_id,
                                                  const std::string& variant = {});

    [[nodiscard]] bool contains(const ShaderVariantKey& key) const {
        return m_entries.find(key) != m_entries.end();
    }

    /// Recompile every variant of a template; requires hot reload to be enabled
    [[nodiscard]] lumen_core::Result<void> hot_reload_shader(const std::string& template_id);

    // =========================================================================
    // Compile queue
    // =========================================================================

    /// Queue every variant of the named templates; returns entries queued
    std::size_t precompile_shaders(const std::vector<std::string>& template_ids);

    /// Queue specific variants; returns entries queued
    std::size_t warmup(const std::vector<ShaderVariantKey>& keys);

    /// Compile up to `max_items` queued entries; returns entries processed
    std::size_t process_compile_queue(std::size_t max_items = 1);

    /// Process the queue until empty
    std::size_t drain_compile_queue();

    [[nodiscard]] std::size_t queued_compiles() const noexcept { return m_queue.size(); }

    // =========================================================================
    // Maintenance
    // =========================================================================

    /// Evict idle entries, or all entries when forced; returns bytes freed
    std::size_t cleanup_cache(bool force = false);

    /// Timed cleanup, then one compile queue step
    void update();

    /// Evict everything and fail queued requests
    void dispose();

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] ShaderCacheStats stats() const;
    [[nodiscard]] std::optional<ShaderMetrics> metrics(const ShaderVariantKey& key) const;
    [[nodiscard]] std::size_t program_count() const noexcept { return m_entries.size(); }
    [[nodiscard]] std::size_t memory_usage() const noexcept { return m_memory_usage; }
    [[nodiscard]] const ShaderCacheConfig& config() const noexcept { return m_config; }

private:
    struct CacheEntry {
        ProgramPtr program;
        lumen_core::TimePoint last_used;
        std::uint64_t use_count = 0;
        double compile_ms = 0.0;
        double link_ms = 0.0;
        std::size_t memory = 0;
    };

    struct PendingCompile {
        ShaderVariantKey key;
        std::shared_ptr<std::promise<ProgramResult>> promise;
        ProgramFuture future;
    };

    struct Lookup {
        const ShaderTemplate* shader_template = nullptr;
        const ShaderVariant* variant = nullptr;
        ShaderVariantKey key;
    };

    [[nodiscard]] lumen_core::Result<Lookup> lookup(const std::string& template_id,
                                                    const std::string& variant) const;

    /// Cached program for a hit, bumping usage and announcing it
    [[nodiscard]] ProgramPtr take_hit(const ShaderVariantKey& key);

    /// Preprocess, compile, link and cache one variant
    [[nodiscard]] ProgramResult compile(const ShaderTemplate& shader_template,
                                        const ShaderVariant& variant);

    /// Queue a compile unless one is already pending for the key
    ProgramFuture enqueue(const ShaderVariantKey& key);

    /// Resolve and drop any queued request for the key
    void settle_pending(const ShaderVariantKey& key, const ProgramResult& result);

    std::size_t evict(bool force, const ShaderVariantKey* keep);
    void evict_template(const std::string& template_id);
    void release_entry(const CacheEntry& entry);

    lumen_gpu::IGraphicsDevice& m_device;
    lumen_event::EventBus& m_events;
    ShaderCacheConfig m_config;
    ShaderLibrary m_library;
    Preprocessor m_preprocessor;
    const lumen_core::TimeSource& m_time;

    std::map<std::string, ShaderTemplate> m_templates;
    std::map<ShaderVariantKey, CacheEntry> m_entries;
    std::deque<PendingCompile> m_queue;

    std::size_t m_memory_usage = 0;
    std::uint64_t m_hits = 0;
    std::uint64_t m_misses = 0;
    lumen_core::TimePoint m_last_cleanup;
    bool m_compiling = false;
    bool m_cleaning = false;
};

} // namespace lumen_shader
