#include "vaulttrade/inventory/ContainerRegistry.hpp"
#include "vaulttrade/inventory/InventoryMover.hpp"
#include "vaulttrade/inventory/SlotContainer.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace vaulttrade::inventory {
namespace {

// Claims to move more than asked, and moves nothing.
class OverReportingContainer : public Container {
public:
    explicit OverReportingContainer(std::string name)
        : name_(std::move(name)) {}

    const std::string& name() const noexcept override { return name_; }
    std::map<int, ItemStack> list() const override { return {{0, ItemStack{"widget", 10}}}; }
    std::int64_t moveUnits(Container&, int, std::int64_t count) override { return count * 3; }
    std::int64_t receive(const std::string&, std::int64_t) override { return 0; }

private:
    std::string name_;
};

class InventoryTest : public ::testing::Test {
protected:
    SlotContainer& add(const std::string& name, int slots = 27, std::int64_t stackLimit = 64) {
        return static_cast<SlotContainer&>(registry.add(std::make_unique<SlotContainer>(name, slots, stackLimit)));
    }

    ContainerRegistry registry;
    InventoryMover mover{registry};
};

TEST_F(InventoryTest, ReceiveTopsUpStacksBeforeOpeningSlots) {
    auto& chest = add("chest", 3, 10);
    EXPECT_EQ(chest.receive("widget", 4), 4);
    EXPECT_EQ(chest.receive("gear", 2), 2);
    EXPECT_EQ(chest.receive("widget", 9), 9);

    auto contents = chest.list();
    ASSERT_EQ(contents.size(), 3u);
    EXPECT_EQ(contents.at(0).count, 10);
    EXPECT_EQ(contents.at(1).item, "gear");
    EXPECT_EQ(contents.at(2).count, 3);
}

TEST_F(InventoryTest, ReceiveStopsWhenFull) {
    auto& chest = add("chest", 2, 5);
    EXPECT_EQ(chest.receive("widget", 12), 10);
    EXPECT_EQ(chest.receive("gear", 1), 0);
    EXPECT_EQ(chest.receive("", 3), 0);
    EXPECT_EQ(chest.receive("widget", -1), 0);
}

TEST_F(InventoryTest, MoverReportsOnlyWhatArrived) {
    auto& source = add("source");
    auto& target = add("target", 1, 4);
    source.receive("widget", 10);

    EXPECT_EQ(mover.move(source, target, "widget", 10), 4);
    EXPECT_EQ(InventoryMover::scan(source).at("widget"), 6);
    EXPECT_EQ(InventoryMover::scan(target).at("widget"), 4);
}

TEST_F(InventoryTest, MoverSkipsOtherItems) {
    auto& source = add("source");
    auto& target = add("target");
    source.receive("gear", 5);
    source.receive("widget", 3);

    EXPECT_EQ(mover.move(source, target, "widget", 10), 3);
    EXPECT_EQ(InventoryMover::scan(source).at("gear"), 5);
    EXPECT_EQ(InventoryMover::scan(target).count("gear"), 0u);
}

TEST_F(InventoryTest, NonPositiveRequestMovesNothing) {
    auto& source = add("source");
    auto& target = add("target");
    source.receive("widget", 5);
    EXPECT_EQ(mover.move(source, target, "widget", 0), 0);
    EXPECT_EQ(mover.move(source, target, "widget", -2), 0);
    EXPECT_TRUE(target.list().empty());
}

TEST_F(InventoryTest, OverReportedMovesAreClamped) {
    registry.add(std::make_unique<OverReportingContainer>("liar"));
    auto& target = add("target");
    auto* liar = registry.find("liar");
    ASSERT_NE(liar, nullptr);

    EXPECT_EQ(mover.moveSlot(*liar, target, 0, 4), 4);
    EXPECT_EQ(mover.move(*liar, target, "widget", 6), 6);
}

TEST_F(InventoryTest, NamedMoveReportsMissingContainers) {
    add("source").receive("widget", 2);
    auto report = mover.move("source", "nowhere", "widget", 2);
    EXPECT_EQ(report.moved, 0);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(*report.error, "Container not found: nowhere");

    auto unset = mover.move("", "source", "widget", 2);
    EXPECT_EQ(*unset.error, "Container not found: (unset)");
    EXPECT_FALSE(mover.scan(std::string("nowhere")).has_value());
}

TEST_F(InventoryTest, MovingIntoTheSameContainerMovesNothing) {
    auto& vault = add("vault", 3, 4);
    vault.receive("widget", 5);

    for (const auto& [slot, stack] : vault.list()) {
        EXPECT_EQ(vault.moveUnits(vault, slot, stack.count), 0);
    }
    EXPECT_EQ(mover.move(vault, vault, "widget", 5), 0);

    auto report = mover.move("vault", "vault", "widget", 5);
    EXPECT_EQ(report.moved, 0);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(*report.error, "Source and destination are the same container");
    EXPECT_EQ(InventoryMover::scan(vault).at("widget"), 5);
}

TEST_F(InventoryTest, TakeRemovesAcrossSlots) {
    auto& chest = add("chest", 3, 4);
    chest.receive("widget", 10);
    EXPECT_EQ(chest.take("widget", 6), 6);
    EXPECT_EQ(InventoryMover::scan(chest).at("widget"), 4);
    EXPECT_EQ(chest.take("widget", 9), 4);
    EXPECT_TRUE(chest.list().empty());
}

TEST_F(InventoryTest, RegistrySnapshotRestoresContents) {
    add("vault", 5, 16).receive("widget", 20);
    add("chest").receive("gear", 1);
    auto snapshot = registry.snapshot();

    ContainerRegistry restored;
    restored.restore(snapshot);
    auto names = restored.names();
    ASSERT_EQ(names.size(), 2u);

    auto* vault = static_cast<SlotContainer*>(restored.find("vault"));
    ASSERT_NE(vault, nullptr);
    EXPECT_EQ(vault->slotCount(), 5);
    EXPECT_EQ(vault->stackLimit(), 16);
    EXPECT_EQ(InventoryMover::scan(*vault).at("widget"), 20);
}

TEST_F(InventoryTest, RestoreSkipsMalformedEntries) {
    boost::json::array entries{
        boost::json::object{{"slots", 3}},
        42,
        boost::json::object{{"name", "ok"}, {"contents", boost::json::array{
            boost::json::object{{"slot", 1}, {"item", "widget"}, {"count", 2}}}}}};

    ContainerRegistry restored;
    restored.restore(entries);
    EXPECT_EQ(restored.names().size(), 1u);
    auto* ok = restored.find("ok");
    ASSERT_NE(ok, nullptr);
    EXPECT_EQ(ok->list().at(1).count, 2);
    EXPECT_EQ(restored.find(""), nullptr);
}

} // namespace
} // namespace vaulttrade::inventory
