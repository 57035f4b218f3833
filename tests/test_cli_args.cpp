#include "args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

/* argv as the CLI sees it: program name and mode first. */
class Argv {
public:
    explicit Argv(std::vector<std::string> opts)
        : store_{"borestitch-cli", "stitch"}
    {
        store_.insert(store_.end(), opts.begin(), opts.end());
        for (auto& s : store_) ptrs_.push_back(s.data());
    }
    int argc() const { return int(ptrs_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> store_;
    std::vector<char*> ptrs_;
};

} // namespace

TEST(CliArgs, ValuesFlagsAndDefaults) {
    Argv a({"--folder=frames", "--unwrap", "--threads=4", "--overlap=120"});
    const CliArgs args(a.argc(), a.argv());

    EXPECT_EQ(args.str("folder"), "frames");
    EXPECT_EQ(args.str("save", "out"), "out");
    EXPECT_TRUE(args.flag("unwrap"));
    EXPECT_FALSE(args.flag("deblur"));
    EXPECT_EQ(args.integer("threads", 0, 0, 256), 4);
    EXPECT_EQ(args.integer("overlap", 0, 0, 1 << 20), 120);
    EXPECT_EQ(args.integer("missing", 7, 0, 10), 7);
    EXPECT_NO_THROW(args.allowOnly({"folder", "unwrap", "threads", "overlap"}));
}

TEST(CliArgs, MalformedValuesAreReported) {
    Argv a({"--threads=four", "--step=2.5x", "--frames=0", "--folder"});
    const CliArgs args(a.argc(), a.argv());

    EXPECT_THROW(args.integer("threads", 0, 0, 256), ArgError);
    EXPECT_THROW(args.real("step", 20.0, -100.0, 100.0), ArgError);
    EXPECT_THROW(args.integer("frames", 6, 1, 100), ArgError);
    EXPECT_THROW(args.str("folder"), ArgError);       // flag where a value is needed
    EXPECT_THROW(args.flag("threads"), ArgError);     // value where a flag is expected
}

TEST(CliArgs, UnknownOptionsAndStrayArgumentsAreRejected) {
    Argv typo({"--folder=x", "--detecter=orb"});
    const CliArgs args(typo.argc(), typo.argv());
    EXPECT_THROW(args.allowOnly({"folder", "detector"}), ArgError);

    // --verbose / --quiet are accepted by every mode
    Argv quiet({"--folder=x", "--quiet"});
    EXPECT_NO_THROW(CliArgs(quiet.argc(), quiet.argv()).allowOnly({"folder"}));

    Argv stray({"frames"});
    EXPECT_THROW(CliArgs(stray.argc(), stray.argv()), ArgError);
}

TEST(CliArgs, EnumOptions) {
    Argv a({"--detector=ORB", "--defocus=lr", "--pattern=rings"});
    const CliArgs args(a.argc(), a.argv());
    ASSERT_TRUE(args.detector().has_value());
    EXPECT_EQ(*args.detector(), borestitch::DetectorType::ORB);
    ASSERT_TRUE(args.defocusMethod().has_value());
    EXPECT_EQ(*args.defocusMethod(), borestitch::DefocusMethod::LucyRichardson);
    EXPECT_EQ(args.choice("pattern", "texture", {"texture", "grid", "rings", "checker"}), "rings");

    Argv none(std::vector<std::string>{});
    const CliArgs empty(none.argc(), none.argv());
    EXPECT_FALSE(empty.detector().has_value());
    EXPECT_FALSE(empty.defocusMethod().has_value());
    EXPECT_EQ(empty.choice("pattern", "texture", {"texture", "grid"}), "texture");

    Argv bad({"--detector=surf", "--defocus=blind", "--pattern=stripes"});
    const CliArgs wrong(bad.argc(), bad.argv());
    EXPECT_THROW(wrong.detector(), ArgError);
    EXPECT_THROW(wrong.defocusMethod(), ArgError);
    EXPECT_THROW(wrong.choice("pattern", "texture", {"texture", "grid"}), ArgError);
}
