/// @file test_object_store.cpp
/// @brief Tests for ObjectStore

#include <catch2/catch_test_macros.hpp>
#include <lumen/resource/object_store.hpp>

using namespace lumen_resource;

namespace {

ObjectRecord make(const std::string& id, ObjectKind kind, std::size_t size) {
    ObjectRecord record;
    record.id = id;
    record.kind = kind;
    record.state = LifecycleState::Ready;
    record.size_bytes = size;
    return record;
}

} // namespace

TEST_CASE("ObjectStore: insert and find", "[resource][store]") {
    ObjectStore store;

    auto result = store.insert(make("tex", ObjectKind::Texture, 64), lumen_gpu::TextureHandle{7});
    REQUIRE(result.is_ok());
    REQUIRE(store.contains("tex"));
    REQUIRE(store.size() == 1);

    const auto* entry = store.find("tex");
    REQUIRE(entry != nullptr);
    REQUIRE(entry->record.size_bytes == 64);
    REQUIRE(std::get<lumen_gpu::TextureHandle>(entry->object).id == 7);
    REQUIRE(store.find("other") == nullptr);
}

TEST_CASE("ObjectStore: duplicate id rejected", "[resource][store]") {
    ObjectStore store;

    REQUIRE(store.insert(make("a", ObjectKind::Texture, 1), {}).is_ok());
    auto dup = store.insert(make("a", ObjectKind::Buffer, 2), {});

    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code() == lumen_core::ErrorCode::AlreadyExists);
    REQUIRE(dup.error().as<lumen_core::ResourceError>()->kind == lumen_core::ResourceError::Kind::DuplicateId);
    REQUIRE(store.find("a")->record.kind == ObjectKind::Texture);
}

TEST_CASE("ObjectStore: touch updates access metadata", "[resource][store]") {
    ObjectStore store;
    lumen_core::ManualTimeSource time;

    auto record = make("a", ObjectKind::Texture, 1);
    record.created_at = time.now();
    record.last_accessed = time.now();
    REQUIRE(store.insert(record, {}).is_ok());

    time.advance(std::chrono::seconds(3));
    REQUIRE(store.touch("a", time.now()));
    REQUIRE_FALSE(store.touch("missing", time.now()));

    const auto& touched = store.find("a")->record;
    REQUIRE(touched.access_count == 1);
    REQUIRE(touched.last_accessed == time.now());
    REQUIRE(touched.created_at < touched.last_accessed);
}

TEST_CASE("ObjectStore: accounting skips attachments", "[resource][store]") {
    ObjectStore store;

    REQUIRE(store.insert(make("tex", ObjectKind::Texture, 100), {}).is_ok());
    REQUIRE(store.insert(make("vbo", ObjectKind::Buffer, 40), {}).is_ok());

    auto fb = make("fb", ObjectKind::Framebuffer, 30);
    fb.dependents = {"fb_color_0"};
    REQUIRE(store.insert(fb, {}).is_ok());

    auto color = make("fb_color_0", ObjectKind::Texture, 30);
    color.parent = "fb";
    REQUIRE(store.insert(color, {}).is_ok());

    REQUIRE(store.bytes(MemoryCategory::Textures) == 100);
    REQUIRE(store.bytes(MemoryCategory::Buffers) == 40);
    REQUIRE(store.bytes(MemoryCategory::Other) == 30);
    REQUIRE(store.usage().total() == 170);
    REQUIRE(store.count(ObjectKind::Texture) == 1);
    REQUIRE(store.count(ObjectKind::Framebuffer) == 1);
}

TEST_CASE("ObjectStore: take removes entry", "[resource][store]") {
    ObjectStore store;
    REQUIRE(store.insert(make("b", ObjectKind::Buffer, 8), lumen_gpu::BufferHandle{3}).is_ok());
    REQUIRE(store.insert(make("a", ObjectKind::Buffer, 8), lumen_gpu::BufferHandle{4}).is_ok());

    REQUIRE(store.ids() == std::vector<std::string>{"a", "b"});

    auto taken = store.take("b");
    REQUIRE(taken.has_value());
    REQUIRE(taken->record.id == "b");
    REQUIRE_FALSE(store.contains("b"));
    REQUIRE_FALSE(store.take("b").has_value());

    store.clear();
    REQUIRE(store.empty());
}
