#include "core/image_selector.h"

#include "temp_dir.h"

#include <map>
#include <memory>
#include <set>

#include <gtest/gtest.h>

using namespace wallspan::core;
using wallspan::test::TempDir;

namespace {

const DisplayRect k_display{1080, 1920, 0, 0};

// Serves images of a fixed size per file name without touching the disk.
// Names missing from the map fail to decode.
class FakeDecoder {
public:
    explicit FakeDecoder(std::map<std::string, Extent> sizes) : sizes_(std::move(sizes)) {}

    bool operator()(const std::string& path, Raster& out, std::string& error) const {
        const auto it = sizes_.find(std::filesystem::path(path).filename().string());
        if (it == sizes_.end()) {
            error = "is not a valid image";
            return false;
        }
        return allocate_raster(it->second.height, it->second.width, out, error);
    }

private:
    std::map<std::string, Extent> sizes_;
};

std::string name_of(const SelectedImage& image) {
    return std::filesystem::path(image.path).filename().string();
}

SelectorOptions sequential_options() {
    SelectorOptions options;
    options.order = SelectionOrder::Sequential;
    return options;
}

} // namespace

TEST(ImageSelector, SequentialFollowsPoolOrderThenReloads) {
    TempDir dir;
    dir.touch("a.png");
    dir.touch("b.png");
    dir.touch("c.png");
    CandidatePool pool({dir.path().string()}, false);
    ImageSelector selector(sequential_options(),
                           FakeDecoder({{"a.png", {10, 10}}, {"b.png", {10, 10}}, {"c.png", {10, 10}}}));

    std::vector<std::string> picked;
    for (int i = 0; i < 4; ++i) {
        std::string error;
        auto image = selector.select_next(k_display, {k_display}, pool, error);
        ASSERT_TRUE(image.has_value()) << error;
        picked.push_back(name_of(*image));
    }
    EXPECT_EQ(picked, (std::vector<std::string>{"a.png", "b.png", "c.png", "a.png"}));
}

TEST(ImageSelector, RandomDrawsWithoutReplacement) {
    TempDir dir;
    std::map<std::string, Extent> sizes;
    for (const char* name : {"a.png", "b.png", "c.png", "d.png", "e.png"}) {
        dir.touch(name);
        sizes[name] = {10, 10};
    }
    CandidatePool pool({dir.path().string()}, false);
    SelectorOptions options;
    options.order = SelectionOrder::Random;
    ImageSelector selector(options, FakeDecoder(sizes), 1234u);

    std::set<std::string> seen;
    for (int i = 0; i < 5; ++i) {
        std::string error;
        auto image = selector.select_next(k_display, {k_display}, pool, error);
        ASSERT_TRUE(image.has_value()) << error;
        EXPECT_TRUE(seen.insert(name_of(*image)).second) << name_of(*image) << " drawn twice";
    }
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_TRUE(pool.empty());
}

TEST(ImageSelector, SameSeedGivesSameSequence) {
    TempDir dir;
    std::map<std::string, Extent> sizes;
    for (const char* name : {"a.png", "b.png", "c.png", "d.png"}) {
        dir.touch(name);
        sizes[name] = {10, 10};
    }
    auto draw_all = [&](std::uint32_t seed) {
        CandidatePool pool({dir.path().string()}, false);
        ImageSelector selector(SelectorOptions{}, FakeDecoder(sizes), seed);
        std::vector<std::string> names;
        for (int i = 0; i < 4; ++i) {
            std::string error;
            auto image = selector.select_next(k_display, {k_display}, pool, error);
            EXPECT_TRUE(image.has_value());
            if (image) {
                names.push_back(name_of(*image));
            }
        }
        return names;
    };
    EXPECT_EQ(draw_all(99u), draw_all(99u));
}

TEST(ImageSelector, SkipsUnreadableFiles) {
    TempDir dir;
    dir.touch("a.png");
    dir.touch("b.png");
    CandidatePool pool({dir.path().string()}, false);
    ImageSelector selector(sequential_options(), FakeDecoder({{"b.png", {10, 10}}}));

    std::string error;
    auto image = selector.select_next(k_display, {k_display}, pool, error);
    ASSERT_TRUE(image.has_value()) << error;
    EXPECT_EQ(name_of(*image), "b.png");
    EXPECT_EQ(image->raster.extent(), (Extent{10, 10}));
}

TEST(ImageSelector, RejectsImagesOverErrorThreshold) {
    TempDir dir;
    dir.touch("a.png");
    dir.touch("b.png");
    dir.touch("c.png");
    CandidatePool pool({dir.path().string()}, false);
    SelectorOptions options = sequential_options();
    options.max_error_percent = 10.0;
    // a.png crops 25% of its scaled area on a 16:9 display.
    ImageSelector selector(options,
                           FakeDecoder({{"a.png", {600, 800}}, {"b.png", {540, 960}}, {"c.png", {540, 960}}}));

    std::string error;
    auto image = selector.select_next(k_display, {k_display}, pool, error);
    ASSERT_TRUE(image.has_value()) << error;
    EXPECT_EQ(name_of(*image), "b.png");
    // Rejected candidates stay in the pool.
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(std::filesystem::path(pool.at(0)).filename().string(), "a.png");
}

TEST(ImageSelector, ReturnsNothingWhenEveryImageIsRejected) {
    TempDir dir;
    dir.touch("a.png");
    dir.touch("b.png");
    CandidatePool pool({dir.path().string()}, false);
    SelectorOptions options = sequential_options();
    options.max_error_percent = 5.0;
    ImageSelector selector(options, FakeDecoder({{"a.png", {600, 800}}, {"b.png", {1000, 100}}}));

    std::string error;
    EXPECT_FALSE(selector.select_next(k_display, {k_display}, pool, error).has_value());
    EXPECT_TRUE(error.empty());
}

TEST(ImageSelector, ReturnsNothingForEmptySources) {
    TempDir dir;
    dir.touch("readme.txt");
    CandidatePool pool({dir.path().string()}, false);
    ImageSelector selector(sequential_options(), FakeDecoder({}));

    std::string error;
    EXPECT_FALSE(selector.select_next(k_display, {k_display}, pool, error).has_value());
    EXPECT_TRUE(error.empty());
}

TEST(ImageSelector, ReportsReloadFailure) {
    TempDir dir;
    CandidatePool pool({(dir.path() / "gone").string()}, false);
    ImageSelector selector(sequential_options(), FakeDecoder({}));

    std::string error;
    EXPECT_FALSE(selector.select_next(k_display, {k_display}, pool, error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(ImageSelector, SingleImageModeMeasuresAgainstAllDisplays) {
    TempDir dir;
    dir.touch("narrow.png");
    dir.touch("wide.png");
    CandidatePool pool({dir.path().string()}, false);
    SelectorOptions options = sequential_options();
    options.max_error_percent = 1.0;
    options.scaling.single_image = true;
    ImageSelector selector(options, FakeDecoder({{"narrow.png", {768, 1024}}, {"wide.png", {384, 1024}}}));

    const std::vector<DisplayRect> displays = {{768, 1024, 0, 0}, {768, 1024, 0, 1024}};
    std::string error;
    auto image = selector.select_next(displays[0], displays, pool, error);
    ASSERT_TRUE(image.has_value()) << error;
    EXPECT_EQ(name_of(*image), "wide.png");
}

TEST(ImageSelector, RepeatedSourceIsEligibleOncePerListing) {
    TempDir dir;
    const std::string a = dir.touch("a.png").string();
    const std::string b = dir.touch("b.png").string();
    CandidatePool pool({a, a, b}, false);
    ImageSelector selector(sequential_options(), FakeDecoder({{"a.png", {10, 10}}, {"b.png", {10, 10}}}));

    std::vector<std::string> picked;
    for (int i = 0; i < 4; ++i) {
        std::string error;
        auto image = selector.select_next(k_display, {k_display}, pool, error);
        ASSERT_TRUE(image.has_value()) << error;
        picked.push_back(name_of(*image));
    }
    EXPECT_EQ(picked, (std::vector<std::string>{"a.png", "a.png", "b.png", "a.png"}));
}

TEST(ImageSelector, FailedDecodeKeepsOtherListingsOfSamePath) {
    TempDir dir;
    const std::string a = dir.touch("a.png").string();
    const std::string b = dir.touch("b.png").string();
    CandidatePool pool({a, a, b}, false);

    // The first attempt on a.png fails, later ones succeed.
    auto a_attempts = std::make_shared<int>(0);
    ImageDecoder flaky = [a_attempts](const std::string& path, Raster& out, std::string& error) {
        if (std::filesystem::path(path).filename() == "a.png" && (*a_attempts)++ == 0) {
            error = "is truncated";
            return false;
        }
        return allocate_raster(10, 10, out, error);
    };
    ImageSelector selector(sequential_options(), flaky);

    std::string error;
    auto first = selector.select_next(k_display, {k_display}, pool, error);
    ASSERT_TRUE(first.has_value()) << error;
    EXPECT_EQ(name_of(*first), "a.png");
    // Only the listing that was returned leaves the pool.
    ASSERT_EQ(pool.size(), 2u);
    EXPECT_EQ(std::filesystem::path(pool.at(0)).filename().string(), "a.png");

    auto second = selector.select_next(k_display, {k_display}, pool, error);
    ASSERT_TRUE(second.has_value()) << error;
    EXPECT_EQ(name_of(*second), "a.png");
    EXPECT_EQ(*a_attempts, 3);
}
