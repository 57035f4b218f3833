#include "borestitch/core/Config.hpp"
#include "borestitch/core/Errors.hpp"
#include "borestitch/io/Artifacts.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace borestitch;
namespace fs = std::filesystem;

namespace {

class TempDir : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("borestitch_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    fs::path dir_;
};

} // namespace

TEST_F(TempDir, ConfigSurvivesSaveAndLoad) {
    Config cfg;
    cfg.minOverlapPx = 120;
    cfg.enableDeblur = true;
    cfg.defocusMethod = DefocusMethod::LucyRichardson;
    cfg.features.detector = DetectorType::ORB;
    cfg.features.maxKeypoints = 900;
    cfg.motion.ratioTest = 0.6;
    cfg.motion.templ.scales = {1.0, 0.5};
    cfg.motion.seed = 1234567890123ull;
    cfg.compose.marginRows = 50;
    cfg.unwrap.cacheAxis = false;
    cfg.depth.totalPipeLengthMm = 1200.0;

    saveConfig(path("cfg.yml"), cfg);
    const Config back = loadConfig(path("cfg.yml"));

    EXPECT_EQ(back.minOverlapPx, 120);
    EXPECT_TRUE(back.enableDeblur);
    EXPECT_EQ(back.defocusMethod, DefocusMethod::LucyRichardson);
    EXPECT_EQ(back.features.detector, DetectorType::ORB);
    EXPECT_EQ(back.features.maxKeypoints, 900);
    EXPECT_DOUBLE_EQ(back.motion.ratioTest, 0.6);
    EXPECT_EQ(back.motion.templ.scales, (std::vector<double>{1.0, 0.5}));
    EXPECT_EQ(back.motion.seed, 1234567890123ull);
    EXPECT_EQ(back.compose.marginRows, 50);
    EXPECT_FALSE(back.unwrap.cacheAxis);
    EXPECT_DOUBLE_EQ(back.depth.totalPipeLengthMm, 1200.0);
    EXPECT_EQ(back.unwrap.axis.passes.size(), cfg.unwrap.axis.passes.size());
}

TEST_F(TempDir, PartialConfigKeepsDefaults) {
    {
        std::ofstream ofs(path("partial.yml"));
        ofs << "%YAML:1.0\n---\nmin_overlap_px: 42\nmotion:\n   ratio_test: 0.7\n";
    }
    const Config cfg = loadConfig(path("partial.yml"));
    const Config def;
    EXPECT_EQ(cfg.minOverlapPx, 42);
    EXPECT_DOUBLE_EQ(cfg.motion.ratioTest, 0.7);
    EXPECT_EQ(cfg.motion.minMatches, def.motion.minMatches);
    EXPECT_EQ(cfg.compose.marginRows, def.compose.marginRows);
}

TEST_F(TempDir, BadConfigFilesThrow) {
    EXPECT_THROW(loadConfig(path("missing.yml")), std::runtime_error);

    {
        std::ofstream ofs(path("range.yml"));
        ofs << "%YAML:1.0\n---\nmotion:\n   ratio_test: 1.5\n";
    }
    EXPECT_THROW(loadConfig(path("range.yml")), std::runtime_error);

    {
        std::ofstream ofs(path("type.yml"));
        ofs << "%YAML:1.0\n---\nmin_overlap_px: \"lots\"\n";
    }
    EXPECT_THROW(loadConfig(path("type.yml")), std::runtime_error);
}

TEST_F(TempDir, UnrepresentableNumbersAreInputErrors) {
    const char* cases[] = {
        "motion:\n   min_matches: -3\n",
        "motion:\n   min_samples: 1.0e30\n",
        "unwrap:\n   calibration_frames: -1\n",
        "min_overlap_px: 5.0e12\n",
        "motion:\n   seed: -7\n",
    };
    int i = 0;
    for (const char* body : cases) {
        const std::string file = path("num" + std::to_string(i++) + ".yml");
        {
            std::ofstream ofs(file);
            ofs << "%YAML:1.0\n---\n" << body;
        }
        EXPECT_THROW(loadConfig(file), InputError) << body;
    }
}

TEST(ConfigValidation, RejectsOutOfRangeValues) {
    EXPECT_NO_THROW(validateConfig(Config{}));

    Config scale;
    scale.motion.scaleLo = 1.2;
    scale.motion.scaleHi = 0.8;
    EXPECT_THROW(validateConfig(scale), std::runtime_error);

    Config keypoints;
    keypoints.features.maxKeypoints = 0;
    EXPECT_THROW(validateConfig(keypoints), std::runtime_error);

    Config depth;
    depth.depth.totalPipeLengthMm = 1.0;
    depth.depth.initialDepthMm = 5.0;
    EXPECT_THROW(validateConfig(depth), std::runtime_error);
}

TEST_F(TempDir, OffsetsNpyLayout) {
    const std::vector<int> offsets{0, 20, 40, 61};
    writeOffsetsNpy(path("offsets.npy"), offsets);

    const auto size = fs::file_size(path("offsets.npy"));
    EXPECT_EQ((size - offsets.size() * 4) % 64, 0u);

    const std::vector<float> back = readOffsetsNpy(path("offsets.npy"));
    EXPECT_EQ(back, (std::vector<float>{0.f, 20.f, 40.f, 61.f}));

    {
        std::ofstream ofs(path("junk.npy"), std::ios::binary);
        ofs << "not numpy at all";
    }
    EXPECT_THROW(readOffsetsNpy(path("junk.npy")), std::runtime_error);
}

TEST_F(TempDir, ArtifactsFollowSaveIntermediate) {
    StitchResult r;
    r.panorama = testing_support::texture(64, 96);
    r.offsets = {0, 10, 20};

    Config cfg;
    const ArtifactPaths a = saveArtifacts(path("plain"), r, cfg);
    EXPECT_TRUE(fs::exists(a.panorama));
    EXPECT_TRUE(a.offsets.empty());
    EXPECT_FALSE(fs::exists(path("plain/offsets.npy")));

    cfg.saveIntermediate = true;
    const ArtifactPaths b = saveArtifacts(path("full"), r, cfg);
    EXPECT_TRUE(fs::exists(b.panorama));
    ASSERT_TRUE(fs::exists(b.offsets));
    EXPECT_EQ(readOffsetsNpy(b.offsets).size(), 3u);

    const cv::Mat png = cv::imread(b.panorama, cv::IMREAD_COLOR);
    ASSERT_FALSE(png.empty());
    EXPECT_EQ(cv::norm(png, r.panorama, cv::NORM_INF), 0.0);
}

TEST_F(TempDir, EmptyPanoramaIsNotSaved) {
    EXPECT_THROW(saveArtifacts(path("none"), StitchResult{}, Config{}), std::runtime_error);
}
