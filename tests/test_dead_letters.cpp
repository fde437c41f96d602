#include <catch2/catch.hpp>
#include "dead_letters.hpp"
#include <stdexcept>

using namespace topicbus;

namespace {

DeadLetter letter(int value) {
    return DeadLetter{std::make_exception_ptr(std::runtime_error("failed")), value, "failed"};
}

} // namespace

TEST_CASE("DeadLetterBuffer: accepts entries up to capacity", "[dead_letters]") {
    DeadLetterBuffer buffer(2);
    REQUIRE(buffer.capacity() == 2);
    REQUIRE(buffer.size() == 0);

    REQUIRE(buffer.try_push(letter(1)));
    REQUIRE_FALSE(buffer.full());
    REQUIRE(buffer.try_push(letter(2)));
    REQUIRE(buffer.full());
}

TEST_CASE("DeadLetterBuffer: drops new entries once full", "[dead_letters]") {
    DeadLetterBuffer buffer(2);
    buffer.try_push(letter(1));
    buffer.try_push(letter(2));

    REQUIRE_FALSE(buffer.try_push(letter(3)));
    REQUIRE_FALSE(buffer.try_push(letter(4)));

    auto letters = buffer.snapshot();
    REQUIRE(letters.size() == 2);
    REQUIRE(std::any_cast<int>(letters[0].data) == 1);
    REQUIRE(std::any_cast<int>(letters[1].data) == 2);
}

TEST_CASE("DeadLetterBuffer: zero capacity drops everything", "[dead_letters]") {
    DeadLetterBuffer buffer(0);
    REQUIRE(buffer.full());
    REQUIRE_FALSE(buffer.try_push(letter(1)));
    REQUIRE(buffer.snapshot().empty());
}
