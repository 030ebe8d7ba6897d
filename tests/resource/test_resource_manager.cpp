/// @file test_resource_manager.cpp
/// @brief Tests for ResourceManager

#include <catch2/catch_test_macros.hpp>
#include <lumen/resource/resource.hpp>
#include <lumen/gpu/null_device.hpp>

#include <chrono>
#include <vector>

using namespace lumen_resource;
using namespace std::chrono_literals;
using lumen_gpu::NullDevice;
using lumen_gpu::DeviceCall;

namespace {

TextureConfig texture(std::uint32_t w, std::uint32_t h) {
    TextureConfig config;
    config.desc.width = w;
    config.desc.height = h;
    config.desc.format = lumen_gpu::TextureFormat::Rgba8;
    return config;
}

struct Fixture {
    NullDevice device;
    lumen_event::EventBus events;
    lumen_core::ManualTimeSource time;
};

} // namespace

TEST_CASE("ResourceManager: create texture", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    std::vector<std::string> created;
    f.events.subscribe<ResourceCreated>([&created](const ResourceCreated& e) {
        created.push_back(e.record.id);
    });

    auto ref = manager.create_texture("tex", texture(16, 16));
    REQUIRE(ref.is_ok());
    REQUIRE(ref->texture().is_valid());
    REQUIRE(ref->record.state == LifecycleState::Ready);
    REQUIRE(ref->record.size_bytes == 16 * 16 * 4);
    REQUIRE(created == std::vector<std::string>{"tex"});
    REQUIRE(f.device.live_textures() == 1);
    REQUIRE(manager.memory_usage().textures == 1024);
}

TEST_CASE("ResourceManager: duplicate id fails fast", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());
    f.device.reset_call_counts();

    auto dup = manager.create("tex", BufferConfig{{lumen_gpu::BufferType::Vertex, lumen_gpu::BufferUsage::Static, 64}, {}});
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code() == lumen_core::ErrorCode::AlreadyExists);
    REQUIRE(f.device.call_count(DeviceCall::CreateBuffer) == 0);
}

TEST_CASE("ResourceManager: device failure is not stored", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    f.device.fail_next_allocation();
    auto ref = manager.create_texture("tex", texture(4, 4));

    REQUIRE(ref.is_err());
    REQUIRE(ref.error().is<lumen_core::DeviceError>());
    REQUIRE_FALSE(manager.contains("tex"));

    // The id is free again
    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());
}

TEST_CASE("ResourceManager: zero extent rejected", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    auto ref = manager.create_texture("tex", texture(0, 4));
    REQUIRE(ref.is_err());
    REQUIRE(ref.error().code() == lumen_core::ErrorCode::InvalidArgument);
}

TEST_CASE("ResourceManager: get touches metadata", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);
    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());

    f.time.advance(2s);
    auto ref = manager.get("tex");
    REQUIRE(ref.has_value());
    REQUIRE(ref->record.access_count == 1);
    REQUIRE(ref->record.last_accessed == f.time.now());

    REQUIRE_FALSE(manager.get("missing").has_value());

    // peek has no side effects
    REQUIRE(manager.peek("tex")->access_count == 1);
    REQUIRE(manager.peek("tex")->access_count == 1);
}

TEST_CASE("ResourceManager: delete succeeds only at zero references", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);
    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());

    std::vector<DeleteRejected> rejected;
    std::vector<std::string> disposed;
    f.events.subscribe<DeleteRejected>([&rejected](const DeleteRejected& e) { rejected.push_back(e); });
    f.events.subscribe<ResourceDisposed>([&disposed](const ResourceDisposed& e) {
        REQUIRE(e.record.state == LifecycleState::Disposed);
        disposed.push_back(e.record.id);
    });

    manager.add_ref("tex");
    REQUIRE_FALSE(manager.destroy("tex"));
    REQUIRE(rejected.size() == 1);
    REQUIRE(rejected[0].ref_count == 1);
    REQUIRE(manager.contains("tex"));

    manager.release_ref("tex");
    manager.release_ref("tex");
    REQUIRE(manager.ref_count("tex") == 0);

    REQUIRE(manager.destroy("tex"));
    REQUIRE(disposed == std::vector<std::string>{"tex"});
    REQUIRE(f.device.live_textures() == 0);
    REQUIRE_FALSE(manager.destroy("tex"));
}

TEST_CASE("ResourceManager: zero reference callback", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);
    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());

    int calls = 0;
    manager.add_ref("tex");
    manager.on_zero_references("tex", [&](const std::string& id) {
        ++calls;
        REQUIRE(manager.destroy(id));
    });

    manager.release_ref("tex");
    REQUIRE(calls == 1);
    REQUIRE_FALSE(manager.contains("tex"));
}

TEST_CASE("ResourceManager: framebuffer attachments", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    FramebufferConfig config;
    config.width = 8;
    config.height = 8;
    config.color_formats = {lumen_gpu::TextureFormat::Rgba8};
    config.depth_format = lumen_gpu::TextureFormat::Depth24Stencil8;

    auto fb = manager.create_framebuffer("fb", config);
    REQUIRE(fb.is_ok());
    REQUIRE(fb->framebuffer().is_valid());
    REQUIRE(fb->record.dependents == std::vector<std::string>{"fb_color_0", "fb_depth"});
    REQUIRE(fb->record.size_bytes == 8 * 8 * 4 * 2);

    REQUIRE(manager.contains("fb_color_0"));
    REQUIRE(manager.peek("fb_depth")->parent == "fb");
    REQUIRE(f.device.live_textures() == 2);
    REQUIRE(f.device.live_framebuffers() == 1);

    // Counted once, under the framebuffer
    auto usage = manager.memory_usage();
    REQUIRE(usage.textures == 0);
    REQUIRE(usage.other == 8 * 8 * 4 * 2);
    REQUIRE(manager.resource_stats().framebuffers == 1);
    REQUIRE(manager.resource_stats().textures == 0);

    SECTION("attachment cannot be deleted while the parent lives") {
        REQUIRE_FALSE(manager.destroy("fb_color_0"));
        REQUIRE(manager.contains("fb_color_0"));
    }

    SECTION("deleting the framebuffer disposes its attachments") {
        REQUIRE(manager.destroy("fb"));
        REQUIRE_FALSE(manager.contains("fb_color_0"));
        REQUIRE_FALSE(manager.contains("fb_depth"));
        REQUIRE(f.device.live_textures() == 0);
        REQUIRE(f.device.live_framebuffers() == 0);
    }

    SECTION("attachment ids are reserved") {
        auto clash = manager.create_texture("fb_depth", texture(2, 2));
        REQUIRE(clash.is_err());
    }
}

TEST_CASE("ResourceManager: framebuffer failure rolls back attachments", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    FramebufferConfig config;
    config.width = 8;
    config.height = 8;
    config.color_formats.assign(8, lumen_gpu::TextureFormat::Rgba8);

    auto fb = manager.create_framebuffer("fb", config);
    REQUIRE(fb.is_err());
    REQUIRE(f.device.live_textures() == 0);
    REQUIRE_FALSE(manager.contains("fb_color_0"));
}

TEST_CASE("ResourceManager: resize framebuffer", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    FramebufferConfig config;
    config.width = 4;
    config.height = 4;
    REQUIRE(manager.create_framebuffer("fb", config).is_ok());

    auto resized = manager.resize_framebuffer("fb", 16, 8);
    REQUIRE(resized.is_ok());
    REQUIRE(resized->record.size_bytes == 16 * 8 * 4);
    REQUIRE(f.device.live_textures() == 1);
    REQUIRE(f.device.live_framebuffers() == 1);

    manager.add_ref("fb");
    auto rejected = manager.resize_framebuffer("fb", 32, 32);
    REQUIRE(rejected.is_err());
    REQUIRE(rejected.error().as<lumen_core::ResourceError>()->kind
            == lumen_core::ResourceError::Kind::HasReferences);
}

TEST_CASE("ResourceManager: failed resize keeps the framebuffer", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    FramebufferConfig config;
    config.width = 64;
    config.height = 64;
    config.depth_format = lumen_gpu::TextureFormat::Depth24Stencil8;
    auto created = manager.create_framebuffer("scene", config);
    REQUIRE(created.is_ok());
    const auto original = created->framebuffer();

    std::size_t disposed = 0;
    f.events.subscribe<ResourceDisposed>([&disposed](const ResourceDisposed&) { ++disposed; });

    f.device.fail_next_allocation();
    auto failed = manager.resize_framebuffer("scene", 128, 128);
    REQUIRE(failed.is_err());

    REQUIRE(disposed == 0);
    REQUIRE(manager.contains("scene"));
    REQUIRE(manager.contains("scene_color_0"));
    REQUIRE(manager.contains("scene_depth"));
    REQUIRE(manager.peek("scene_color_0")->size_bytes == 64 * 64 * 4);
    REQUIRE(manager.get("scene")->framebuffer() == original);
    REQUIRE(f.device.live_textures() == 2);
    REQUIRE(f.device.live_framebuffers() == 1);

    SECTION("next attempt succeeds") {
        auto resized = manager.resize_framebuffer("scene", 128, 128);
        REQUIRE(resized.is_ok());
        REQUIRE(manager.peek("scene_color_0")->size_bytes == 128 * 128 * 4);
        REQUIRE(disposed == 3);
        REQUIRE(f.device.live_textures() == 2);
        REQUIRE(f.device.live_framebuffers() == 1);
    }
}

TEST_CASE("ResourceManager: update texture", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);
    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());

    std::vector<std::uint8_t> pixels(2 * 2 * 4, 0xff);
    REQUIRE(manager.update_texture("tex", {0, 0, 2, 2}, pixels.data()).is_ok());
    REQUIRE(f.device.call_count(DeviceCall::UpdateTexture) == 1);

    REQUIRE(manager.update_texture("missing", {0, 0, 2, 2}, pixels.data()).is_err());

    auto wrapped = manager.update_texture("tex", {0xFFFFFFFEu, 0, 4, 1}, pixels.data());
    REQUIRE(wrapped.is_err());
    REQUIRE(wrapped.error().code() == lumen_core::ErrorCode::InvalidArgument);
}

TEST_CASE("ResourceManager: GC selection", "[resource][manager][gc]") {
    Fixture f;
    ResourceManagerConfig config;
    config.gc.max_unused = 60000ms;
    config.gc.max_age = 300000ms;
    ResourceManager manager(f.device, f.events, config, f.time);

    REQUIRE(manager.create_texture("idle", texture(4, 4)).is_ok());
    REQUIRE(manager.create_texture("held", texture(4, 4)).is_ok());
    manager.add_ref("held");

    f.time.advance(61s);
    REQUIRE(manager.create_texture("fresh", texture(4, 4)).is_ok());

    std::vector<GcCompleted> completed;
    f.events.subscribe<GcCompleted>([&completed](const GcCompleted& e) { completed.push_back(e); });

    auto report = manager.perform_gc();
    REQUIRE(report.freed_count == 1);
    REQUIRE(report.freed_bytes == 64);
    REQUIRE_FALSE(manager.contains("idle"));
    REQUIRE(manager.contains("held"));
    REQUIRE(manager.contains("fresh"));
    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0].reason == GcReason::Manual);

    // Referenced objects survive regardless of age
    f.time.advance(1000s);
    manager.force_gc();
    REQUIRE(manager.contains("held"));
    REQUIRE_FALSE(manager.contains("fresh"));
}

TEST_CASE("ResourceManager: scheduled GC on interval", "[resource][manager][gc]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);
    REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());

    std::vector<GcReason> started;
    f.events.subscribe<GcStarted>([&started](const GcStarted& e) { started.push_back(e.reason); });

    f.time.advance(4s);
    manager.update();
    REQUIRE(started.empty());

    f.time.advance(1s);
    manager.update();
    REQUIRE(started == std::vector<GcReason>{GcReason::Scheduled});

    manager.update();
    REQUIRE(started.size() == 1);
}

TEST_CASE("ResourceManager: disabled GC never runs on schedule", "[resource][manager][gc]") {
    Fixture f;
    ResourceManagerConfig config;
    config.gc.enabled = false;
    ResourceManager manager(f.device, f.events, config, f.time);

    int runs = 0;
    f.events.subscribe<GcStarted>([&runs](const GcStarted&) { ++runs; });

    f.time.advance(1h);
    manager.update();
    REQUIRE(runs == 0);
}

TEST_CASE("ResourceManager: memory pressure end to end", "[resource][manager][gc]") {
    Fixture f;
    ResourceManagerConfig config;
    config.budget.textures = 3000;
    ResourceManager manager(f.device, f.events, config, f.time);

    std::vector<MemoryPressure> pressure;
    std::vector<GcCompleted> completed;
    std::vector<std::string> order;
    f.events.subscribe<MemoryPressure>([&](const MemoryPressure& e) {
        pressure.push_back(e);
        order.push_back("pressure");
    });
    f.events.subscribe<GcStarted>([&order](const GcStarted&) { order.push_back("gc"); });
    f.events.subscribe<GcCompleted>([&completed](const GcCompleted& e) { completed.push_back(e); });

    REQUIRE(manager.create_texture("a", texture(16, 16)).is_ok());   // 1024 bytes
    REQUIRE(manager.create_texture("b", texture(16, 16)).is_ok());
    REQUIRE(pressure.empty());

    f.time.advance(61s);
    REQUIRE(manager.create_texture("c", texture(16, 16)).is_ok());

    REQUIRE(pressure.size() == 1);
    REQUIRE(pressure[0].category == MemoryCategory::Textures);
    REQUIRE(pressure[0].used == 3072);
    REQUIRE(pressure[0].budget == 3000);
    REQUIRE(order == std::vector<std::string>{"pressure", "gc"});

    REQUIRE(completed.size() == 1);
    REQUIRE(completed[0].reason == GcReason::MemoryPressure);
    REQUIRE(completed[0].freed_count >= 1);
    REQUIRE(manager.contains("c"));
    REQUIRE(manager.memory_usage().textures <= 3000);
}

TEST_CASE("ResourceManager: standalone buffers", "[resource][manager]") {
    Fixture f;
    ResourceManager manager(f.device, f.events, {}, f.time);

    BufferConfig config;
    config.desc = {lumen_gpu::BufferType::Uniform, lumen_gpu::BufferUsage::Dynamic, 256};
    auto ref = manager.create_buffer("ubo", config);

    REQUIRE(ref.is_ok());
    REQUIRE(ref->buffer().is_valid());
    REQUIRE(manager.memory_usage().buffers == 256);
    REQUIRE(manager.resource_stats().buffers == 1);
}

TEST_CASE("ResourceManager: dispose frees everything once", "[resource][manager]") {
    Fixture f;
    int disposed = 0;
    f.events.subscribe<ResourceDisposed>([&disposed](const ResourceDisposed&) { ++disposed; });

    {
        ResourceManager manager(f.device, f.events, {}, f.time);
        REQUIRE(manager.create_texture("tex", texture(4, 4)).is_ok());

        FramebufferConfig config;
        config.width = 4;
        config.height = 4;
        REQUIRE(manager.create_framebuffer("fb", config).is_ok());
        manager.add_ref("tex");

        manager.dispose();
        REQUIRE(manager.is_disposed());
        REQUIRE(disposed == 3);
        REQUIRE(manager.create_texture("late", texture(4, 4)).is_err());
    }

    REQUIRE(disposed == 3);
    REQUIRE(f.device.live_textures() == 0);
    REQUIRE(f.device.live_framebuffers() == 0);
}

TEST_CASE("ResourceManager: stats report utilization", "[resource][manager]") {
    Fixture f;
    ResourceManagerConfig config;
    config.budget.total = 4096;
    ResourceManager manager(f.device, f.events, config, f.time);

    REQUIRE(manager.create_texture("tex", texture(16, 16)).is_ok());
    auto stats = manager.resource_stats();
    REQUIRE(stats.textures == 1);
    REQUIRE(stats.total_memory == 1024);
    REQUIRE(stats.utilization == 0.25);
}
