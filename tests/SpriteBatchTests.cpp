#include "gw/core/Error.hpp"
#include "gw/graphics/SpriteBatch.hpp"
#include "gw/graphics/Texture2D.hpp"

#include "TestPlatform.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

using gw::graphics::BlendState;
using gw::graphics::Color;
using gw::graphics::Rectangle;
using gw::graphics::SpriteBatch;
using gw::graphics::SpriteEffects;
using gw::graphics::SpriteSortMode;
using gw::graphics::Texture2D;

namespace {

struct BatchFixture {
    gwtest::RecordingGraphicsDevice device;
    std::shared_ptr<Texture2D> first;
    std::shared_ptr<Texture2D> second;

    BatchFixture() {
        device.SetViewport(gw::graphics::Viewport{0, 0, 320, 240});
        first = Texture2D::MakeSolid(device, 16, 16, Color::White);
        second = Texture2D::MakeSolid(device, 8, 4, Color::Red);
    }
};

} // namespace

TEST_CASE("SpriteBatch rejects calls outside Begin and End", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    REQUIRE_THROWS_AS(batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White),
                      gw::core::InvalidOperationError);
    REQUIRE_THROWS_AS(batch.End(), gw::core::InvalidOperationError);

    batch.Begin();
    REQUIRE(batch.IsActive());
    REQUIRE_THROWS_AS(batch.Begin(), gw::core::InvalidOperationError);
    batch.End();
    REQUIRE_FALSE(batch.IsActive());
}

TEST_CASE("SpriteBatch submits one call per run of the same texture", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    batch.Begin();
    batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White);
    batch.Draw(*fixture.first, glm::vec2(20.0f, 0.0f), Color::White);
    batch.Draw(*fixture.second, glm::vec2(40.0f, 0.0f), Color::White);
    batch.Draw(*fixture.first, glm::vec2(60.0f, 0.0f), Color::White);
    REQUIRE(batch.QueuedSpriteCount() == 4);
    REQUIRE(fixture.device.drawCalls.empty());
    batch.End();

    const auto& calls = fixture.device.drawCalls;
    REQUIRE(calls.size() == 3);
    REQUIRE(calls[0].texture == fixture.first->Handle());
    REQUIRE(calls[0].spriteCount == 2);
    REQUIRE(calls[1].texture == fixture.second->Handle());
    REQUIRE(calls[2].texture == fixture.first->Handle());
    REQUIRE(calls[0].vertices.size() == 2 * gw::graphics::kVerticesPerSprite);
}

TEST_CASE("SpriteBatch Texture sort mode groups sprites by texture", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    batch.Begin(SpriteSortMode::Texture, BlendState::Additive);
    batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White);
    batch.Draw(*fixture.second, glm::vec2(0.0f), Color::White);
    batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White);
    batch.End();

    const auto& calls = fixture.device.drawCalls;
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].spriteCount + calls[1].spriteCount == 3);
    REQUIRE(calls[0].blendState == BlendState::Additive);
}

TEST_CASE("SpriteBatch depth sort modes order by layer depth", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    auto drawAtDepth = [&](const Texture2D& texture, float depth) {
        batch.Draw(texture, glm::vec2(0.0f), std::nullopt, Color::White, 0.0f, glm::vec2(0.0f),
                   glm::vec2(1.0f), SpriteEffects::None, depth);
    };

    SECTION("back to front") {
        batch.Begin(SpriteSortMode::BackToFront);
        drawAtDepth(*fixture.first, 0.1f);
        drawAtDepth(*fixture.second, 0.9f);
        batch.End();
        REQUIRE(fixture.device.drawCalls.front().texture == fixture.second->Handle());
    }

    SECTION("front to back") {
        batch.Begin(SpriteSortMode::FrontToBack);
        drawAtDepth(*fixture.second, 0.9f);
        drawAtDepth(*fixture.first, 0.1f);
        batch.End();
        REQUIRE(fixture.device.drawCalls.front().texture == fixture.first->Handle());
    }
}

TEST_CASE("SpriteBatch Immediate mode submits every draw right away", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    batch.Begin(SpriteSortMode::Immediate);
    batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White);
    REQUIRE(fixture.device.drawCalls.size() == 1);
    batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White);
    REQUIRE(fixture.device.drawCalls.size() == 2);
    batch.End();
    REQUIRE(fixture.device.drawCalls.size() == 2);
}

TEST_CASE("SpriteBatch builds quads from position, source and scale", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    batch.Begin();
    batch.Draw(*fixture.first, glm::vec2(10.0f, 20.0f), Rectangle(4, 0, 8, 8), Color::White,
               0.0f, glm::vec2(0.0f), glm::vec2(2.0f), SpriteEffects::None, 0.0f);
    batch.End();

    const auto& vertices = fixture.device.drawCalls.at(0).vertices;
    // Top-left, top-right, bottom-right, bottom-left.
    REQUIRE(vertices[0].position.x == Catch::Approx(10.0f));
    REQUIRE(vertices[0].position.y == Catch::Approx(20.0f));
    REQUIRE(vertices[2].position.x == Catch::Approx(26.0f));
    REQUIRE(vertices[2].position.y == Catch::Approx(36.0f));
    REQUIRE(vertices[0].texCoord.x == Catch::Approx(0.25f));
    REQUIRE(vertices[1].texCoord.x == Catch::Approx(0.75f));
    REQUIRE(vertices[2].texCoord.y == Catch::Approx(0.5f));
}

TEST_CASE("SpriteBatch applies flips, tint and destination rectangles", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    batch.Begin();
    batch.Draw(*fixture.first, Rectangle(0, 0, 32, 64), std::nullopt, Color::Red, 0.0f,
               glm::vec2(0.0f), SpriteEffects::FlipHorizontally, 0.0f);
    batch.End();

    const auto& vertices = fixture.device.drawCalls.at(0).vertices;
    REQUIRE(vertices[2].position.x == Catch::Approx(32.0f));
    REQUIRE(vertices[2].position.y == Catch::Approx(64.0f));
    REQUIRE(vertices[0].texCoord.x == Catch::Approx(1.0f));
    REQUIRE(vertices[1].texCoord.x == Catch::Approx(0.0f));
    REQUIRE(vertices[0].color.r == Catch::Approx(1.0f));
    REQUIRE(vertices[0].color.g == Catch::Approx(0.0f));
}

TEST_CASE("SpriteBatch projects back buffer pixels to clip space", "[graphics][spritebatch]") {
    BatchFixture fixture;
    SpriteBatch batch(fixture.device);

    batch.Begin();
    batch.Draw(*fixture.first, glm::vec2(0.0f), Color::White);
    batch.End();

    const glm::mat4& transform = fixture.device.drawCalls.at(0).transform;
    const glm::vec4 topLeft = transform * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    const glm::vec4 bottomRight = transform * glm::vec4(320.0f, 240.0f, 0.0f, 1.0f);
    REQUIRE(topLeft.x == Catch::Approx(-1.0f));
    REQUIRE(topLeft.y == Catch::Approx(1.0f));
    REQUIRE(bottomRight.x == Catch::Approx(1.0f));
    REQUIRE(bottomRight.y == Catch::Approx(-1.0f));
}

TEST_CASE("Texture2D validates pixel buffers and releases its handle", "[graphics]") {
    gwtest::RecordingGraphicsDevice device;

    REQUIRE_THROWS_AS(Texture2D::FromPixels(device, 4, 4, std::vector<std::uint8_t>(8)),
                      gw::core::GraphicsError);
    REQUIRE_THROWS_AS(Texture2D::FromPixels(device, 0, 4, {}), gw::core::GraphicsError);

    device.failTextureCreation = true;
    REQUIRE_THROWS_AS(Texture2D::MakeSolid(device, 2, 2, Color::Blue), gw::core::GraphicsError);
    device.failTextureCreation = false;

    auto texture = Texture2D::MakeSolid(device, 2, 3, Color::Blue);
    REQUIRE(texture->Width() == 2);
    REQUIRE(texture->Height() == 3);
    REQUIRE(texture->Bounds() == Rectangle(0, 0, 2, 3));
    REQUIRE(device.LiveTextureCount() == 1);

    texture.reset();
    REQUIRE(device.LiveTextureCount() == 0);
    REQUIRE(device.destroyedTextures.size() == 1);
}

TEST_CASE("Color and Rectangle helpers", "[graphics]") {
    REQUIRE(Color::FromFloats(1.0f, 0.5f, 0.0f) == Color(255, 128, 0, 255));
    REQUIRE(Color::White * 0.5f == Color(128, 128, 128, 128));

    const Rectangle rect(10, 10, 20, 10);
    REQUIRE(rect.Contains(10, 10));
    REQUIRE_FALSE(rect.Contains(30, 10));
    REQUIRE(rect.Intersects(Rectangle(25, 15, 10, 10)));
    REQUIRE_FALSE(rect.Intersects(Rectangle(30, 10, 5, 5)));
}
