/// @file shader_cache.cpp
/// @brief ShaderCache implementation

#include <lumen/shader/shader_cache.hpp>
#include <lumen/core/log.hpp>

#include <algorithm>
#include <set>

namespace lumen_shader {

using lumen_core::Err;
using lumen_core::Error;
using lumen_core::ErrorCode;
using lumen_core::Ok;
using lumen_core::Result;
using lumen_core::ShaderError;

namespace {

/// Driver-side overhead assumed for every linked program
constexpr std::size_t k_base_program_bytes = 1024;

ProgramFuture ready_future(ProgramResult result) {
    std::promise<ProgramResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

} // anonymous namespace

ShaderCache::ShaderCache(lumen_gpu::IGraphicsDevice& device,
                         lumen_event::EventBus& events,
                         ShaderCacheConfig config,
                         ShaderLibrary library,
                         const lumen_core::TimeSource& time)
    : m_device(device)
    , m_events(events)
    , m_config(std::move(config))
    , m_library(std::move(library))
    , m_preprocessor(m_library)
    , m_time(time)
    , m_last_cleanup(time.now()) {
}

ShaderCache::~ShaderCache() {
    dispose();
}

// =============================================================================
// Templates
// =============================================================================

Result<void> ShaderCache::register_template(ShaderTemplate shader_template) {
    if (shader_template.id.empty()) {
        return Err(Error(ErrorCode::InvalidArgument, "Shader template id is empty"));
    }
    if (shader_template.vertex_source.empty() || shader_template.fragment_source.empty()) {
        return Err(Error(ErrorCode::InvalidArgument,
            "Shader template '" + shader_template.id + "' is missing a stage source"));
    }
    if (shader_template.variants.empty()) {
        shader_template.variants.emplace_back("default");
    }

    std::set<std::string> names;
    for (const auto& variant : shader_template.variants) {
        if (!names.insert(variant.name).second) {
            return Err(Error(ErrorCode::InvalidArgument,
                "Shader template '" + shader_template.id + "' declares variant '" + variant.name + "' twice"));
        }
    }

    const std::string id = shader_template.id;
    if (has_template(id)) {
        evict_template(id);
        lumen_core::shader_logger()->debug("Replacing shader template '{}'", id);
    }
    m_templates[id] = std::move(shader_template);

    const auto& stored = m_templates[id];
    lumen_core::shader_logger()->debug("Registered shader template '{}' ({} variant(s))",
                                       id, stored.variants.size());

    if (m_config.precompile_common_variants) {
        const std::size_t count = std::min(m_config.precompile_variant_count, stored.variants.size());
        for (std::size_t i = 0; i < count; ++i) {
            ShaderVariantKey key{id, stored.variants[i].name};
            if (!contains(key)) {
                enqueue(key);
            }
        }
    }

    return Ok();
}

Result<void> ShaderCache::register_builtin_templates() {
    for (auto& shader_template : builtin_templates()) {
        auto registered = register_template(std::move(shader_template));
        if (!registered) {
            return registered;
        }
    }
    return Ok();
}

Result<void> ShaderCache::update_template_sources(const std::string& template_id,
                                                  std::string vertex_source,
                                                  std::string fragment_source) {
    auto it = m_templates.find(template_id);
    if (it == m_templates.end()) {
        return Err(ShaderError::template_not_found(template_id));
    }
    it->second.vertex_source = std::move(vertex_source);
    it->second.fragment_source = std::move(fragment_source);
    return Ok();
}

const ShaderTemplate* ShaderCache::find_template(const std::string& template_id) const {
    auto it = m_templates.find(template_id);
    return it != m_templates.end() ? &it->second : nullptr;
}

// =============================================================================
// Programs
// =============================================================================

ProgramResult ShaderCache::get_program(const std::string& template_id, const std::string& variant) {
    auto found = lookup(template_id, variant);
    if (!found) {
        return Err<ProgramPtr>(found.error());
    }
    const ShaderVariantKey key = found->key;

    if (contains(key)) {
        return Ok(take_hit(key));
    }

    ++m_misses;
    lumen_core::shader_logger()->trace("Cache miss for '{}'", key.to_string());
    m_events.publish(CacheMiss{key});

    auto result = compile(*found->shader_template, *found->variant);
    settle_pending(key, result);
    return result;
}

ProgramFuture ShaderCache::get_program_async(const std::string& template_id, const std::string& variant) {
    auto found = lookup(template_id, variant);
    if (!found) {
        return ready_future(Err<ProgramPtr>(found.error()));
    }
    const ShaderVariantKey key = found->key;

    if (contains(key)) {
        return ready_future(Ok(take_hit(key)));
    }

    ++m_misses;
    lumen_core::shader_logger()->trace("Cache miss for '{}'", key.to_string());
    m_events.publish(CacheMiss{key});

    if (!m_config.async_compilation) {
        auto result = compile(*found->shader_template, *found->variant);
        settle_pending(key, result);
        return ready_future(std::move(result));
    }

    return enqueue(key);
}

Result<void> ShaderCache::hot_reload_shader(const std::string& template_id) {
    if (!m_config.hot_reload) {
        return Err(Error(ErrorCode::NotSupported, "Hot reload is disabled"));
    }
    auto it = m_templates.find(template_id);
    if (it == m_templates.end()) {
        return Err(ShaderError::template_not_found(template_id));
    }

    evict_template(template_id);

    for (const auto& variant : it->second.variants) {
        auto result = compile(it->second, variant);
        settle_pending(ShaderVariantKey{template_id, variant.name}, result);
        if (!result) {
            lumen_core::shader_logger()->warn("Hot reload of '{}' failed at variant '{}'",
                                              template_id, variant.name);
            m_events.publish(HotReload{template_id, false});
            return Err(result.error());
        }
    }

    lumen_core::shader_logger()->info("Hot reloaded '{}' ({} variant(s))",
                                      template_id, it->second.variants.size());
    m_events.publish(HotReload{template_id, true});
    return Ok();
}

// =============================================================================
// Compile queue
// =============================================================================

std::size_t ShaderCache::precompile_shaders(const std::vector<std::string>& template_ids) {
    std::size_t queued = 0;
    for (const auto& id : template_ids) {
        const auto* shader_template = find_template(id);
        if (!shader_template) {
            lumen_core::shader_logger()->warn("Cannot precompile unknown template '{}'", id);
            continue;
        }
        for (const auto& variant : shader_template->variants) {
            ShaderVariantKey key{id, variant.name};
            if (!contains(key)) {
                const std::size_t before = m_queue.size();
                enqueue(key);
                queued += m_queue.size() - before;
            }
        }
    }
    return queued;
}

std::size_t ShaderCache::warmup(const std::vector<ShaderVariantKey>& keys) {
    std::size_t queued = 0;
    for (const auto& requested : keys) {
        auto found = lookup(requested.template_id, requested.variant);
        if (!found) {
            lumen_core::shader_logger()->warn("Skipping warmup of '{}': {}",
                                              requested.to_string(), found.error().message());
            continue;
        }
        if (!contains(found->key)) {
            const std::size_t before = m_queue.size();
            enqueue(found->key);
            queued += m_queue.size() - before;
        }
    }
    return queued;
}

std::size_t ShaderCache::process_compile_queue(std::size_t max_items) {
    if (m_compiling) {
        return 0;
    }
    m_compiling = true;

    std::size_t processed = 0;
    while (processed < max_items && !m_queue.empty()) {
        PendingCompile item = std::move(m_queue.front());
        m_queue.pop_front();
        ++processed;

        ProgramResult result = [&]() -> ProgramResult {
            auto cached = m_entries.find(item.key);
            if (cached != m_entries.end()) {
                return Ok(cached->second.program);
            }
            auto found = lookup(item.key.template_id, item.key.variant);
            if (!found) {
                lumen_core::shader_logger()->warn("Queued compile of '{}' dropped: {}",
                                                  item.key.to_string(), found.error().message());
                m_events.publish(ShaderFailed{item.key, found.error()});
                return Err<ProgramPtr>(found.error());
            }
            return compile(*found->shader_template, *found->variant);
        }();

        item.promise->set_value(std::move(result));
    }

    m_compiling = false;
    return processed;
}

std::size_t ShaderCache::drain_compile_queue() {
    std::size_t total = 0;
    while (!m_queue.empty()) {
        const std::size_t processed = process_compile_queue(m_queue.size());
        if (processed == 0) {
            break;
        }
        total += processed;
    }
    return total;
}

// =============================================================================
// Maintenance
// =============================================================================

std::size_t ShaderCache::cleanup_cache(bool force) {
    m_last_cleanup = m_time.now();
    return evict(force, nullptr);
}

void ShaderCache::update() {
    if (m_time.now() - m_last_cleanup >= m_config.cleanup_interval) {
        cleanup_cache(false);
    }
    process_compile_queue(1);
}

void ShaderCache::dispose() {
    while (!m_queue.empty()) {
        PendingCompile item = std::move(m_queue.front());
        m_queue.pop_front();
        item.promise->set_value(Err<ProgramPtr>(Error(ErrorCode::InvalidState,
            "Shader cache disposed before '" + item.key.to_string() + "' was compiled")));
    }
    evict(true, nullptr);
}

// =============================================================================
// Statistics
// =============================================================================

ShaderCacheStats ShaderCache::stats() const {
    ShaderCacheStats stats;
    stats.programs = m_entries.size();
    stats.memory_usage = m_memory_usage;
    stats.memory_limit = m_config.memory_limit;
    stats.hits = m_hits;
    stats.misses = m_misses;
    const auto lookups = m_hits + m_misses;
    stats.hit_rate = lookups > 0 ? static_cast<double>(m_hits) / static_cast<double>(lookups) : 0.0;
    stats.queued = m_queue.size();
    return stats;
}

std::optional<ShaderMetrics> ShaderCache::metrics(const ShaderVariantKey& key) const {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    const auto& entry = it->second;
    return ShaderMetrics{entry.compile_ms, entry.link_ms, entry.use_count, entry.last_used};
}

// =============================================================================
// Internals
// =============================================================================

Result<ShaderCache::Lookup> ShaderCache::lookup(const std::string& template_id,
                                                const std::string& variant) const {
    const auto* shader_template = find_template(template_id);
    if (!shader_template) {
        return Err<Lookup>(ShaderError::template_not_found(template_id));
    }
    const auto* found = shader_template->find_variant(variant);
    if (!found) {
        return Err<Lookup>(ShaderError::variant_not_found(template_id, variant));
    }
    return Ok(Lookup{shader_template, found, ShaderVariantKey{template_id, found->name}});
}

ProgramPtr ShaderCache::take_hit(const ShaderVariantKey& key) {
    auto& entry = m_entries.at(key);
    entry.last_used = m_time.now();
    ++entry.use_count;
    ++m_hits;

    lumen_core::shader_logger()->trace("Cache hit for '{}'", key.to_string());
    m_events.publish(CacheHit{key});
    return entry.program;
}

ProgramResult ShaderCache::compile(const ShaderTemplate& shader_template, const ShaderVariant& variant) {
    const ShaderVariantKey key{shader_template.id, variant.name};

    auto fail = [this, &key](Error error) -> ProgramResult {
        error.with_context("template", key.template_id).with_context("variant", key.variant);
        lumen_core::shader_logger()->error("Shader '{}' failed: {}", key.to_string(), error.message());
        m_events.publish(ShaderFailed{key, error});
        return Err<ProgramPtr>(std::move(error));
    };

    const auto start = lumen_core::Clock::now();

    auto vertex = m_preprocessor.process(shader_template.vertex_source, variant.defines);
    if (!vertex) {
        return fail(vertex.error());
    }
    auto fragment = m_preprocessor.process(shader_template.fragment_source, variant.defines);
    if (!fragment) {
        return fail(fragment.error());
    }

    auto vs = m_device.compile_shader_stage(lumen_gpu::ShaderStage::Vertex, *vertex);
    if (!vs) {
        return fail(vs.error());
    }
    auto fs = m_device.compile_shader_stage(lumen_gpu::ShaderStage::Fragment, *fragment);
    if (!fs) {
        m_device.destroy_shader_stage(*vs);
        return fail(fs.error());
    }

    const auto link_start = lumen_core::Clock::now();
    auto linked = m_device.link_program(*vs, *fs);

    // Stages are no longer needed once the program is linked
    m_device.destroy_shader_stage(*vs);
    m_device.destroy_shader_stage(*fs);
    if (!linked) {
        return fail(linked.error());
    }
    const auto end = lumen_core::Clock::now();

    CacheEntry entry;
    entry.program = std::make_shared<ShaderProgram>(key, *linked, m_device.reflect_program(*linked),
                                                    shader_template.default_uniforms);
    entry.last_used = m_time.now();
    entry.compile_ms = lumen_core::to_millis(link_start - start);
    entry.link_ms = lumen_core::to_millis(end - link_start);
    entry.memory = k_base_program_bytes + vertex->size() + fragment->size();

    auto existing = m_entries.find(key);
    if (existing != m_entries.end()) {
        release_entry(existing->second);
        m_memory_usage -= existing->second.memory;
        m_entries.erase(existing);
    }

    ProgramPtr program = entry.program;
    const double elapsed = entry.compile_ms + entry.link_ms;
    m_memory_usage += entry.memory;
    m_entries.emplace(key, std::move(entry));

    lumen_core::shader_logger()->debug("Compiled '{}' in {:.2f} ms", key.to_string(), elapsed);
    m_events.publish(ShaderCompiled{key, elapsed});

    if (m_memory_usage > m_config.memory_limit) {
        evict(false, &key);
        if (m_memory_usage > m_config.memory_limit) {
            lumen_core::shader_logger()->warn("Shader cache over its limit: {} / {} bytes",
                                              m_memory_usage, m_config.memory_limit);
        }
    }

    return Ok(std::move(program));
}

ProgramFuture ShaderCache::enqueue(const ShaderVariantKey& key) {
    for (const auto& pending : m_queue) {
        if (pending.key == key) {
            return pending.future;
        }
    }

    PendingCompile pending;
    pending.key = key;
    pending.promise = std::make_shared<std::promise<ProgramResult>>();
    pending.future = pending.promise->get_future().share();
    ProgramFuture future = pending.future;
    m_queue.push_back(std::move(pending));

    lumen_core::shader_logger()->trace("Queued compile of '{}' ({} pending)", key.to_string(), m_queue.size());
    return future;
}

void ShaderCache::settle_pending(const ShaderVariantKey& key, const ProgramResult& result) {
    auto it = std::find_if(m_queue.begin(), m_queue.end(),
        [&key](const PendingCompile& pending) { return pending.key == key; });
    if (it == m_queue.end()) {
        return;
    }
    it->promise->set_value(result);
    m_queue.erase(it);
}

std::size_t ShaderCache::evict(bool force, const ShaderVariantKey* keep) {
    if (m_cleaning) {
        return 0;
    }
    m_cleaning = true;

    const auto now = m_time.now();
    std::size_t freed_bytes = 0;
    std::size_t freed_count = 0;

    for (auto it = m_entries.begin(); it != m_entries.end();) {
        const auto& entry = it->second;
        bool remove = force
            || now - entry.last_used > m_config.expiration
            || (m_memory_usage > m_config.memory_limit && entry.use_count == 0);
        if (keep && it->first == *keep) {
            remove = false;
        }

        if (!remove) {
            ++it;
            continue;
        }

        release_entry(entry);
        freed_bytes += entry.memory;
        m_memory_usage -= entry.memory;
        ++freed_count;
        it = m_entries.erase(it);
    }

    m_cleaning = false;

    if (freed_count > 0) {
        lumen_core::shader_logger()->info("Shader cache cleanup freed {} program(s), {} bytes",
                                          freed_count, freed_bytes);
        m_events.publish(CacheCleaned{freed_bytes, freed_count});
    }
    return freed_bytes;
}

void ShaderCache::evict_template(const std::string& template_id) {
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->first.template_id != template_id) {
            ++it;
            continue;
        }
        release_entry(it->second);
        m_memory_usage -= it->second.memory;
        it = m_entries.erase(it);
    }
}

void ShaderCache::release_entry(const CacheEntry& entry) {
    entry.program->invalidate();
    m_device.destroy_program(entry.program->handle());
}

} // namespace lumen_shader
