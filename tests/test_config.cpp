#include <gtest/gtest.h>

#include "config.h"
#include "errors.h"
#include "grid/grid.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

using namespace ssg;

namespace {

constexpr char const* ANALYSIS = R"(
[grid]
threads = 3

[grid.x]
min = 0
max = 6
cell_size = 2

[grid.y]
order = ["low", "mid", "high"]

[output]
format = "json"
per_trajectory = true

[[trajectories]]
id = "dyad_a"
x = [0, 1, 5]
y = ["low", "low", "high"]
t = [0, 1, 2.5, 4]

[[trajectories]]
x = [6]
y = ["mid"]
t = [10, 12]
)";

std::vector<AxisValue> labels(std::vector<std::string> const& values) {
    return std::vector<AxisValue>(values.begin(), values.end());
}

class ConfigFileTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("ssgrid_config_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string write(std::string const& name, std::string const& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }
};

} // namespace

TEST(ConfigTest, ParsesAnalysisFile) {
    auto config = Config::parse(ANALYSIS);

    EXPECT_EQ(config.grid.thread_count, 3);
    EXPECT_EQ(config.grid.quantization.x.min, AxisValue(0.0));
    EXPECT_EQ(config.grid.quantization.x.max, AxisValue(6.0));
    EXPECT_EQ(config.grid.quantization.x.cell_size, 2.0);
    EXPECT_FALSE(config.grid.quantization.x.order.has_value());
    ASSERT_TRUE(config.grid.quantization.y.order.has_value());
    EXPECT_EQ(*config.grid.quantization.y.order, labels({"low", "mid", "high"}));

    EXPECT_EQ(config.output.format, OutputFormat::Json);
    EXPECT_TRUE(config.output.per_trajectory);
    EXPECT_FALSE(config.output.include_states);
    EXPECT_TRUE(config.output.path.empty());

    ASSERT_EQ(config.trajectories.size(), 2u);
    auto const& first = config.trajectories[0];
    EXPECT_EQ(first.id, "dyad_a");
    EXPECT_EQ(first.x[2], AxisValue(5.0));
    EXPECT_EQ(first.y[2], AxisValue(std::string("high")));
    EXPECT_EQ(first.t, (std::vector<double>{0.0, 1.0, 2.5, 4.0}));
    EXPECT_TRUE(config.trajectories[1].id.empty());
}

TEST(ConfigTest, BuildsTrajectoriesWithGeneratedIds) {
    auto config = Config::parse(ANALYSIS);
    IdGenerator ids;
    auto trajectories = config.buildTrajectories(ids);

    ASSERT_EQ(trajectories.size(), 2u);
    EXPECT_EQ(trajectories[0].id(), "dyad_a");
    EXPECT_EQ(trajectories[1].id(), "trajectory_1");
    EXPECT_EQ(ids.peek(), 2);

    Grid grid(config.grid.quantization, config.grid.thread_count);
    grid.addTrajectories(trajectories);
    EXPECT_EQ(grid.totalCells(), 12u);  // 4 x 3
    EXPECT_EQ(grid.quantizedTrajectories()[0].cells()[2], (Cell{2, 2}));
}

TEST(ConfigTest, InvalidTrajectoryDataFailsOnBuild) {
    auto config = Config::parse(R"(
[[trajectories]]
x = [1, 2]
y = [1, 2]
t = [0, 1]
)");
    IdGenerator ids;
    EXPECT_THROW(config.buildTrajectories(ids), ValidationError);
}

TEST(ConfigTest, MalformedInputRaises) {
    EXPECT_THROW(Config::parse("[grid\nthreads = 1"), ConfigError);
    EXPECT_THROW(Config::parse("[[trajectories]]\nx = [true]\ny = [1]\nt = [0, 1]\n"),
                 ConfigError);
    EXPECT_THROW(Config::parse("[[trajectories]]\nx = [1]\nt = [0, 1]\n"), ConfigError);
    EXPECT_THROW(Config::parse("[[trajectories]]\nx = [1]\ny = [1]\nt = [0, \"a\"]\n"),
                 ConfigError);
    EXPECT_THROW(Config::parse("[grid.x]\ncell_size = \"wide\"\n"), ConfigError);
}

TEST(ConfigTest, UnknownFormatFallsBackToCsv) {
    auto config = Config::parse("[output]\nformat = \"xml\"\n");
    EXPECT_EQ(config.output.format, OutputFormat::Csv);
}

TEST(ConfigTest, NegativeThreadsFallBackToDefault) {
    auto config = Config::parse("[grid]\nthreads = -4\n");
    EXPECT_EQ(config.grid.thread_count, GridParams{}.thread_count);
}

TEST(ConfigTest, AppliesOverrides) {
    auto config = Config::defaults();

    EXPECT_TRUE(config.applyOverride("grid.threads", "0"));
    EXPECT_EQ(config.grid.thread_count, 0);

    EXPECT_TRUE(config.applyOverride("grid.x.cell_size", "0.5"));
    EXPECT_EQ(config.grid.quantization.x.cell_size, 0.5);

    EXPECT_TRUE(config.applyOverride("grid.y.order", "low,mid,high"));
    EXPECT_EQ(*config.grid.quantization.y.order, labels({"low", "mid", "high"}));

    EXPECT_TRUE(config.applyOverride("grid.y.min", "mid"));
    EXPECT_EQ(config.grid.quantization.y.min, AxisValue(std::string("mid")));

    EXPECT_TRUE(config.applyOverride("grid.x.max", "12"));
    EXPECT_EQ(config.grid.quantization.x.max, AxisValue(12.0));

    EXPECT_TRUE(config.applyOverride("output.format", "json"));
    EXPECT_EQ(config.output.format, OutputFormat::Json);

    EXPECT_TRUE(config.applyOverride("output.states", "true"));
    EXPECT_TRUE(config.output.include_states);

    EXPECT_FALSE(config.applyOverride("threads", "2"));
    EXPECT_FALSE(config.applyOverride("grid.z.min", "1"));
    EXPECT_FALSE(config.applyOverride("grid.x.step", "1"));
    EXPECT_FALSE(config.applyOverride("render.width", "1"));
    EXPECT_FALSE(config.applyOverride("grid.threads", "many"));
}

TEST_F(ConfigFileTest, MissingFileYieldsDefaults) {
    auto config = Config::load((dir_ / "absent.toml").string());
    EXPECT_EQ(config.grid.thread_count, 1);
    EXPECT_TRUE(config.trajectories.empty());
}

TEST_F(ConfigFileTest, IncludesAreOverriddenByIncludingFile) {
    write("base.toml", R"(
[grid]
threads = 2

[grid.x]
cell_size = 2

[[trajectories]]
id = "from_base"
x = [1]
y = [1]
t = [0, 1]
)");
    auto path = write("analysis.toml", R"(
include = ["base.toml", "missing.toml"]

[grid]
threads = 8

[[trajectories]]
id = "local"
x = [2]
y = [2]
t = [0, 1]
)");

    auto config = Config::load(path);
    EXPECT_EQ(config.grid.thread_count, 8);
    EXPECT_EQ(config.grid.quantization.x.cell_size, 2.0);
    ASSERT_EQ(config.trajectories.size(), 2u);
    EXPECT_EQ(config.trajectories[0].id, "from_base");
    EXPECT_EQ(config.trajectories[1].id, "local");
}

TEST_F(ConfigFileTest, MalformedFileRaises) {
    auto path = write("broken.toml", "x = [1, 2\n");
    EXPECT_THROW(Config::load(path), ConfigError);
}

TEST_F(ConfigFileTest, SaveAndLoadRoundTrip) {
    auto original = Config::parse(ANALYSIS);
    original.output.path = "out/\"quoted\".csv";
    original.grid.quantization.y.min = std::string("low");

    auto path = (dir_ / "saved.toml").string();
    original.save(path);
    auto loaded = Config::load(path);

    EXPECT_EQ(loaded.grid.thread_count, original.grid.thread_count);
    EXPECT_EQ(loaded.grid.quantization, original.grid.quantization);
    EXPECT_EQ(loaded.output.format, original.output.format);
    EXPECT_EQ(loaded.output.path, original.output.path);
    EXPECT_EQ(loaded.output.per_trajectory, original.output.per_trajectory);

    ASSERT_EQ(loaded.trajectories.size(), original.trajectories.size());
    for (size_t i = 0; i < loaded.trajectories.size(); ++i) {
        EXPECT_EQ(loaded.trajectories[i].id, original.trajectories[i].id);
        EXPECT_EQ(loaded.trajectories[i].x, original.trajectories[i].x);
        EXPECT_EQ(loaded.trajectories[i].y, original.trajectories[i].y);
        EXPECT_EQ(loaded.trajectories[i].t, original.trajectories[i].t);
    }
}

TEST_F(ConfigFileTest, SavedResolvedQuantizationReproducesGrid) {
    auto config = Config::parse(ANALYSIS);
    IdGenerator ids;
    Grid grid(config.grid.quantization);
    grid.addTrajectories(config.buildTrajectories(ids));

    Config resolved = config;
    resolved.grid.quantization = grid.quantizer().toConfig();
    auto path = (dir_ / "resolved.toml").string();
    resolved.save(path);

    auto reloaded = Config::load(path);
    IdGenerator reload_ids;
    Grid replay(reloaded.grid.quantization);
    replay.addTrajectories(reloaded.buildTrajectories(reload_ids));
    EXPECT_EQ(replay.quantizer(), grid.quantizer());
}
