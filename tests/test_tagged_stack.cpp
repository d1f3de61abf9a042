#include <gtest/gtest.h>
#include "Tagged_Stack.hpp"
#include "Tagged_Stack_Sequential.hpp"
#include "Tagged_Stack_Concurrent.hpp"
#include "Tag_Predicates.hpp"

#include <iterator>
#include <list>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace TS_Concurrency;

namespace {
    const Tag X{"x"};
    const Tag Y{"y"};
    const Tag Z{"z"};

    template <typename Range>
    auto values_of(Range&& range) {
        using item_type = std::remove_cvref_t<decltype(*range.begin())>;
        std::vector<typename item_type::value_type> values;
        for (const auto& item : range) values.push_back(item.value());
        return values;
    }

    auto value_is(int value) {
        return [value](const Item<int>& item) { return item.value() == value; };
    }
}

// ============================================================================
// Behavior shared by every container configuration
// ============================================================================

template <typename Stack>
class TaggedStackTest : public ::testing::Test {
protected:
    Stack stack{ "test-stack" };

    std::vector<int> contents() {
        return values_of(stack.stream());
    }
};

using Stack_Types = ::testing::Types<
    Tagged_Stack_Sequential<int>,
    Tagged_Stack_Sequential<int, Tag, std::list<Item<int>>>,
    Tagged_Stack_Concurrent<int>>;
TYPED_TEST_SUITE(TaggedStackTest, Stack_Types);

TYPED_TEST(TaggedStackTest, EmptyStackContract) {
    auto& stack = this->stack;
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.size(), 0u);
    EXPECT_FALSE(stack.pop().has_value());
    EXPECT_FALSE(stack.peek().has_value());
    EXPECT_FALSE(stack.pop(on_tags(has_tag(X))).has_value());
    EXPECT_FALSE(stack.find_first(value_is(1)).has_value());
    EXPECT_TRUE(values_of(stack.find_all(value_is(1))).empty());
}

TYPED_TEST(TaggedStackTest, NameIsKept) {
    EXPECT_EQ(this->stack.name(), "test-stack");
}

TYPED_TEST(TaggedStackTest, LifoOrder) {
    auto& stack = this->stack;
    for (int i = 1; i <= 10; ++i) stack.push(i);
    EXPECT_EQ(stack.size(), 10u);
    for (int i = 10; i >= 1; --i) {
        auto item = stack.pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(item->value(), i);
    }
    EXPECT_TRUE(stack.empty());
}

TYPED_TEST(TaggedStackTest, RoundTripKeepsValueAndTags) {
    auto& stack = this->stack;
    stack.push(42, X, Y);
    auto item = stack.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->value(), 42);
    EXPECT_EQ(item->tags(), (std::unordered_set<Tag>{X, Y}));
}

TYPED_TEST(TaggedStackTest, PushWithTagSet) {
    auto& stack = this->stack;
    stack.push(3, {X, Z});
    EXPECT_EQ(stack.peek()->tags(), (std::unordered_set<Tag>{X, Z}));
}

TYPED_TEST(TaggedStackTest, PredicatePopIsNonContiguous) {
    auto& stack = this->stack;
    stack.push(1, X);  // A
    stack.push(2, Y);  // B
    stack.push(3, X);  // C

    auto matched = stack.pop(on_tags(has_tag(X)));
    ASSERT_TRUE(matched.has_value());
    EXPECT_EQ(matched->value(), 3);

    EXPECT_EQ(stack.pop()->value(), 2);
    EXPECT_EQ(stack.pop()->value(), 1);
    EXPECT_FALSE(stack.pop().has_value());
}

TYPED_TEST(TaggedStackTest, PredicatePopBelowTheTop) {
    auto& stack = this->stack;
    stack.push(1, X);
    stack.push(2, Y);
    stack.push(3, Z);
    stack.push(4, Z);

    EXPECT_EQ(stack.pop(on_tags(has_tag(Y)))->value(), 2);
    EXPECT_EQ(this->contents(), (std::vector<int>{4, 3, 1}));
    EXPECT_FALSE(stack.pop(on_tags(has_tag(Y))).has_value());
}

TYPED_TEST(TaggedStackTest, PeekDoesNotRemove) {
    auto& stack = this->stack;
    stack.push(1, X);
    stack.push(2, Y);

    EXPECT_EQ(stack.peek()->value(), 2);
    EXPECT_EQ(stack.peek(on_tags(has_tag(X)))->value(), 1);
    EXPECT_EQ(stack.size(), 2u);
}

TYPED_TEST(TaggedStackTest, MostRecentMatchingPushWins) {
    auto& stack = this->stack;
    stack.push(100, Tag{"scope:global"});
    stack.push(200, Tag{"scope:session"});
    stack.push(300, Tag{"scope:global"});

    EXPECT_EQ(stack.find_first(on_tags(has_tag(Tag{"scope:global"})))->value(), 300);
    EXPECT_EQ(stack.find_first(on_tags(has_tag(Tag{"scope:session"})))->value(), 200);

    stack.pop(on_tags(has_tag(Tag{"scope:global"})));
    EXPECT_EQ(stack.find_first(on_tags(has_tag(Tag{"scope:global"})))->value(), 100);
}

TYPED_TEST(TaggedStackTest, StreamFiltersByTagSet) {
    auto& stack = this->stack;
    stack.push(1, X);
    stack.push(2, Y);
    stack.push(3, X, Y);
    stack.push(4);
    stack.push(5, Z, X);
    stack.push(6, Y, Z);

    EXPECT_EQ(values_of(stack.stream(has_tag(X))), (std::vector<int>{5, 3, 1}));
    EXPECT_EQ(values_of(stack.stream(all_tags(X, Y))), (std::vector<int>{3}));
    EXPECT_EQ(values_of(stack.stream(any_tag(X, Z))), (std::vector<int>{6, 5, 3, 1}));
    EXPECT_EQ(values_of(stack.stream(no_tags(X, Y, Z))), (std::vector<int>{4}));
    EXPECT_EQ(
        values_of(stack.stream([](const auto& tags) { return tags.contains(Y) && !tags.contains(Z); })),
        (std::vector<int>{3, 2}));
    EXPECT_EQ(values_of(stack.stream()), (std::vector<int>{6, 5, 4, 3, 2, 1}));

    // read-only
    EXPECT_EQ(stack.size(), 6u);
}

TYPED_TEST(TaggedStackTest, FindAllIsLazySinglePass) {
    auto& stack = this->stack;
    for (int i = 1; i <= 6; ++i) stack.push(i);

    int evaluated = 0;
    auto evens = stack.find_all([&evaluated](const Item<int>& item) {
        ++evaluated;
        return item.value() % 2 == 0;
    });
    EXPECT_EQ(evaluated, 0);

    auto it = evens.begin();
    ASSERT_FALSE(it == evens.end());
    EXPECT_EQ(it->value(), 6);
    EXPECT_EQ(evaluated, 1);

    std::vector<int> values{ it->value() };
    for (++it; it != evens.end(); ++it) values.push_back(it->value());
    EXPECT_EQ(values, (std::vector<int>{6, 4, 2}));

    // exhausted: cannot restart
    EXPECT_THROW(evens.begin(), std::logic_error);

    // a new call rescans the current state
    stack.pop();
    EXPECT_EQ(values_of(stack.find_all(value_is(6))), std::vector<int>{});
    EXPECT_EQ(values_of(stack.find_all(value_is(4))), (std::vector<int>{4}));
}

TYPED_TEST(TaggedStackTest, IteratorOutlivesItsRange) {
    auto& stack = this->stack;
    stack.push(1, X);
    stack.push(2, Y);
    stack.push(3, X);

    // the range is a temporary destroyed at the end of the statement
    auto it = stack.stream(has_tag(X)).begin();
    ASSERT_FALSE(it == std::default_sentinel);
    EXPECT_EQ(it->value(), 3);
    ++it;
    ASSERT_FALSE(it == std::default_sentinel);
    EXPECT_EQ(it->value(), 1);
    ++it;
    EXPECT_TRUE(it == std::default_sentinel);
}

TYPED_TEST(TaggedStackTest, RemoveAllIsCompleteAndOrderPreserving) {
    auto& stack = this->stack;
    stack.push(1, X);
    stack.push(2, Y);
    stack.push(3, X);
    stack.push(4, Z);
    stack.push(5, X, Z);
    stack.push(6, Y);

    EXPECT_EQ(stack.remove_all(on_tags(has_tag(X))), 3u);
    EXPECT_FALSE(stack.find_first(on_tags(has_tag(X))).has_value());
    EXPECT_EQ(this->contents(), (std::vector<int>{6, 4, 2}));

    EXPECT_EQ(stack.remove_all(on_tags(has_tag(X))), 0u);
    EXPECT_EQ(stack.size(), 3u);
}

TYPED_TEST(TaggedStackTest, ClearEmptiesTheStack) {
    auto& stack = this->stack;
    for (int i = 0; i < 20; ++i) stack.push(i, X);
    auto detached = stack.pop();
    stack.clear();

    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.size(), 0u);
    ASSERT_TRUE(detached.has_value());
    EXPECT_EQ(detached->value(), 19);
}

TYPED_TEST(TaggedStackTest, ItemsMoveBetweenStacks) {
    auto& stack = this->stack;
    TypeParam other{ "other-stack" };
    other.push(make_item(7, "moved"));
    other.push(8);

    auto item = other.pop(on_tags(has_tag(Tag{"moved"})));
    ASSERT_TRUE(item.has_value());
    stack.push(*item);

    EXPECT_EQ(stack.pop(), make_item(7, "moved"));
    EXPECT_EQ(other.size(), 1u);
}

// ============================================================================
// Engine construction
// ============================================================================

TEST(TaggedStackEngineTest, NullContainerRejected) {
    using Container = Sequential_Deque<Item<int>>;
    EXPECT_THROW(
        (Tagged_Stack<int, Container>("no-container", std::unique_ptr<Container>{})),
        std::invalid_argument);
}

TEST(TaggedStackEngineTest, InjectedContainerIsUsed) {
    using Container = Sequential_Deque<Item<int>, std::list<Item<int>>>;
    auto container = std::make_unique<Container>();
    container->push_front(Item<int>(1));

    Tagged_Stack<int, Container> stack("injected", std::move(container));
    EXPECT_EQ(stack.size(), 1u);
    stack.push(2);
    EXPECT_EQ(stack.pop()->value(), 2);
    EXPECT_EQ(stack.pop()->value(), 1);
}

TEST(TaggedStackEngineTest, GeneratedNamesAreUnique) {
    Tagged_Stack_Sequential<int> first;
    Tagged_Stack_Sequential<int> second;
    EXPECT_EQ(first.name().size(), 36u);
    EXPECT_NE(first.name(), second.name());
}

TEST(TaggedStackEngineTest, NullValueRejectedWithoutSideEffect) {
    Tagged_Stack_Sequential<std::shared_ptr<int>> stack("pointers");
    EXPECT_THROW(stack.push(nullptr, X), std::invalid_argument);
    EXPECT_TRUE(stack.empty());
}

TEST(TaggedStackEngineTest, CustomTagType) {
    enum class Layer { Defaults, User, Override };
    Tagged_Stack_Sequential<std::string, Layer> stack("layers");
    stack.push("default", Layer::Defaults);
    stack.push("user", Layer::User);
    stack.push("override", Layer::Override);

    auto user = stack.find_first([](const Item<std::string, Layer>& item) { return item.has_tag(Layer::User); });
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->value(), "user");
    EXPECT_EQ(values_of(stack.stream(no_tags(Layer::Override))), (std::vector<std::string>{"user", "default"}));
}
