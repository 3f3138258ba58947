#include "gcli/cache/archive_cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace gcli;
using gcli::cache::ArchiveCache;
using gcli::cache::InventorySighting;
using gcli::cache::kInventoryLag;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("gcli_cache_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

class ArchiveCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = ArchiveCache::open("AKIDTEST", ":memory:", [this] { return now; });
        ASSERT_TRUE(opened.is_ok());
        cache = std::move(opened.value());
    }

    InventorySighting sighting(const std::string& id, const std::string& name, Timestamp inventory_date) const {
        InventorySighting s;
        s.id = id;
        s.name = name;
        s.size = 100;
        s.upstream_creation_date = inventory_date - 1000;
        s.upstream_inventory_date = inventory_date;
        s.inventory_job_creation_date = inventory_date + 3600;
        return s;
    }

    std::optional<cache::ArchiveRecord> record(const std::string& id) const {
        auto all = cache->records("vault");
        EXPECT_TRUE(all.is_ok());
        for (const auto& r : all.value()) {
            if (r.id == id) {
                return r;
            }
        }
        return std::nullopt;
    }

    Timestamp now = 1'700'000'000;
    std::unique_ptr<ArchiveCache> cache;
};

} // namespace

TEST_F(ArchiveCacheTest, UploadIsResolvableByNameAndId) {
    ASSERT_TRUE(cache->record_upload("vault", "photos.tar", "A1", 500).is_ok());

    auto by_name = cache->resolve("vault", "photos.tar");
    ASSERT_TRUE(by_name.is_ok());
    EXPECT_EQ(by_name.value(), "A1");

    auto by_id = cache->resolve("vault", "id:A1");
    ASSERT_TRUE(by_id.is_ok());
    EXPECT_EQ(by_id.value(), "A1");

    auto seen = cache->last_seen("vault", "photos.tar");
    ASSERT_TRUE(seen.is_ok());
    EXPECT_EQ(seen.value(), now);

    auto missing = cache->resolve("other-vault", "photos.tar");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(ArchiveCacheTest, SharedNamesListedWithIds) {
    ASSERT_TRUE(cache->record_upload("vault", "report", "B", 1).is_ok());
    ASSERT_TRUE(cache->record_upload("vault", "report", "A", 1).is_ok());
    ASSERT_TRUE(cache->record_upload("vault", "unique", "C", 1).is_ok());
    ASSERT_TRUE(cache->record_upload("vault", "", "D", 1).is_ok());

    auto lines = cache->list_names("vault");
    ASSERT_TRUE(lines.is_ok());
    const std::vector<std::string> expected = {"id:D", "id:A\treport", "id:B\treport", "unique"};
    EXPECT_EQ(lines.value(), expected);

    auto ambiguous = cache->resolve("vault", "report");
    ASSERT_TRUE(ambiguous.is_error());
    EXPECT_EQ(ambiguous.error().kind, ErrorKind::NotFound);
    EXPECT_NE(ambiguous.error().message.find("ambiguous"), std::string::npos);

    auto with_ids = cache->list_with_ids("vault");
    ASSERT_TRUE(with_ids.is_ok());
    ASSERT_EQ(with_ids.value().size(), 4u);
    EXPECT_EQ(with_ids.value().back(), "id:C\tunique");
}

TEST_F(ArchiveCacheTest, ReferenceLookingNamesAreQuoted) {
    ASSERT_TRUE(cache->record_upload("vault", "id:odd", "X", 1).is_ok());

    auto lines = cache->list_names("vault");
    ASSERT_TRUE(lines.is_ok());
    ASSERT_EQ(lines.value().size(), 1u);
    EXPECT_EQ(lines.value()[0], "name:id:odd");

    auto resolved = cache->resolve("vault", lines.value()[0]);
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value(), "X");
}

TEST_F(ArchiveCacheTest, SightingProvesExistenceWithLag) {
    const Timestamp inventory_date = now - 10 * 24 * 3600;
    auto s = sighting("I1", "from-inventory", inventory_date);
    s.inventory_job_creation_date = inventory_date + kInventoryLag + 500;

    ASSERT_TRUE(cache->merge_inventory_sighting("vault", s, false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());

    auto found = record("I1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->last_seen_upstream.value_or(0), inventory_date + 500);
    EXPECT_FALSE(found->created_here.has_value());
    EXPECT_EQ(found->name.value_or(""), "from-inventory");
}

TEST_F(ArchiveCacheTest, MergeIsIdempotentAndMonotonic) {
    const Timestamp newer = now - 3600;
    const auto s = sighting("I1", "a", newer);

    ASSERT_TRUE(cache->merge_inventory_sighting("vault", s, false).is_ok());
    ASSERT_TRUE(cache->merge_inventory_sighting("vault", s, false).is_ok());
    ASSERT_TRUE(cache->merge_inventory_sighting("vault", sighting("I1", "a", newer - 86400), false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());

    auto all = cache->records("vault");
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].last_seen_upstream.value_or(0), newer);
}

TEST_F(ArchiveCacheTest, ConflictingMetadataChangedOnlyWithFix) {
    ASSERT_TRUE(cache->record_upload("vault", "local-name", "A", 100).is_ok());

    auto renamed = sighting("A", "remote-name", now);
    renamed.size = 200;
    ASSERT_TRUE(cache->merge_inventory_sighting("vault", renamed, false).is_ok());
    auto kept = record("A");
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept->name.value_or(""), "local-name");
    EXPECT_EQ(kept->size.value_or(0), 100u);

    ASSERT_TRUE(cache->merge_inventory_sighting("vault", renamed, true).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    auto fixed = record("A");
    ASSERT_TRUE(fixed.has_value());
    EXPECT_EQ(fixed->name.value_or(""), "remote-name");
    EXPECT_EQ(fixed->size.value_or(0), 200u);
}

TEST_F(ArchiveCacheTest, MissingNameIsFilledIn) {
    ASSERT_TRUE(cache->record_upload("vault", "", "A", 0).is_ok());
    ASSERT_TRUE(cache->merge_inventory_sighting("vault", sighting("A", "named-later", now), false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());

    auto resolved = cache->resolve("vault", "named-later");
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_EQ(resolved.value(), "A");
    EXPECT_EQ(record("A")->size.value_or(0), 100u);
}

TEST_F(ArchiveCacheTest, RecentUploadSurvivesInventoryWithoutIt) {
    const Timestamp uploaded_at = now;
    ASSERT_TRUE(cache->record_upload("vault", "fresh", "F", 1).is_ok());

    // Inventory just inside the lag window: the upload may not be listed yet
    now = uploaded_at + kInventoryLag + 2;
    ASSERT_TRUE(cache->finalize_inventory("vault", uploaded_at + kInventoryLag - 1, {}, true).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_TRUE(record("F").has_value());

    // Exactly at the boundary it still gets the benefit of the doubt
    ASSERT_TRUE(cache->finalize_inventory("vault", uploaded_at + kInventoryLag, {}, true).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_TRUE(record("F").has_value());
}

TEST_F(ArchiveCacheTest, DisappearedArchiveRemovedOnlyWithFix) {
    const Timestamp uploaded_at = now;
    ASSERT_TRUE(cache->record_upload("vault", "gone", "G", 1).is_ok());
    const Timestamp inventory_date = uploaded_at + kInventoryLag + 1;

    ASSERT_TRUE(cache->finalize_inventory("vault", inventory_date, {}, false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_TRUE(record("G").has_value());

    ASSERT_TRUE(cache->finalize_inventory("vault", inventory_date, {}, true).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_FALSE(record("G").has_value());
}

TEST_F(ArchiveCacheTest, PreviouslySeenArchiveMissingIsDisappeared) {
    ASSERT_TRUE(cache->merge_inventory_sighting("vault", sighting("S", "seen", now - 100), false).is_ok());
    ASSERT_TRUE(cache->finalize_inventory("vault", now - 100, {"S"}, true).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_TRUE(record("S").has_value());

    ASSERT_TRUE(cache->finalize_inventory("vault", now, {}, true).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_FALSE(record("S").has_value());
}

TEST_F(ArchiveCacheTest, TombstonePurgedOnceInventoryConfirms) {
    ASSERT_TRUE(cache->record_upload("vault", "doomed", "T", 1).is_ok());
    const Timestamp deleted_at = now + 10;
    now = deleted_at;
    ASSERT_TRUE(cache->delete_record("vault", "doomed").is_ok());

    auto hidden = cache->resolve("vault", "doomed");
    ASSERT_TRUE(hidden.is_error());
    auto listed = cache->list_names("vault");
    ASSERT_TRUE(listed.is_ok());
    EXPECT_TRUE(listed.value().empty());

    // Still listed by an inventory older than the deletion: tombstone stays
    auto stale = sighting("T", "doomed", deleted_at - 5);
    ASSERT_TRUE(cache->merge_inventory_sighting("vault", stale, false).is_ok());
    ASSERT_TRUE(cache->finalize_inventory("vault", deleted_at - 5, {"T"}, false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    ASSERT_TRUE(record("T").has_value());
    EXPECT_TRUE(record("T")->tombstoned());

    // Not listed, but inventory predates the deletion: tombstone stays
    ASSERT_TRUE(cache->finalize_inventory("vault", deleted_at, {}, false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_TRUE(record("T").has_value());

    ASSERT_TRUE(cache->finalize_inventory("vault", deleted_at + 1, {}, false).is_ok());
    ASSERT_TRUE(cache->commit().is_ok());
    EXPECT_FALSE(record("T").has_value());
}

TEST(ArchiveCacheFileTest, UncommittedMergeIsRolledBack) {
    const auto dir = create_temp_dir();
    const fs::path db = dir / "nested" / "db";

    {
        auto opened = ArchiveCache::open("AKID", db);
        ASSERT_TRUE(opened.is_ok()) << opened.error().message;
        ASSERT_TRUE(opened.value()->record_upload("vault", "kept", "K", 1).is_ok());

        InventorySighting s;
        s.id = "U";
        s.name = "uncommitted";
        s.upstream_inventory_date = 1'600'000'000;
        s.inventory_job_creation_date = 1'600'000'000;
        ASSERT_TRUE(opened.value()->merge_inventory_sighting("vault", s, false).is_ok());
    }

    auto reopened = ArchiveCache::open("AKID", db);
    ASSERT_TRUE(reopened.is_ok());
    auto records = reopened.value()->records("vault");
    ASSERT_TRUE(records.is_ok());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].id, "K");

    fs::remove_all(dir);
}

TEST(ArchiveCacheFileTest, AccountsAreIsolated) {
    const auto dir = create_temp_dir();
    const fs::path db = dir / "db";

    {
        auto first = ArchiveCache::open("AKID-ONE", db);
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(first.value()->record_upload("vault", "mine", "M", 1).is_ok());
    }

    auto second = ArchiveCache::open("AKID-TWO", db);
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value()->resolve("vault", "mine").is_error());
    ASSERT_TRUE(second.value()->record_upload("vault", "mine", "M", 1).is_ok());

    auto first_again = ArchiveCache::open("AKID-ONE", db);
    ASSERT_TRUE(first_again.is_ok());
    auto records = first_again.value()->records("vault");
    ASSERT_TRUE(records.is_ok());
    ASSERT_EQ(records.value().size(), 1u);
    EXPECT_EQ(records.value()[0].account_key, "AKID-ONE");

    fs::remove_all(dir);
}

TEST(ArchiveCacheFileTest, EmptyAccountKeyRejected) {
    auto opened = ArchiveCache::open("", ":memory:");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().kind, ErrorKind::Usage);
}
