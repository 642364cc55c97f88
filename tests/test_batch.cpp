#include <gtest/gtest.h>
#include "batch.h"

#include <istream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

namespace {

const std::string VALID_A = "018d5e5e-7b3a-7000-8000-000000000000";
const std::string VALID_B = "00000000-03e8-7000-8000-000000000000";
const std::string OUT_OF_RANGE = "ffffffff-ffff-7000-8000-000000000000";

size_t lineCount(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (c == '\n') {
            count++;
        }
    }
    return count;
}

// Serves `text`, then fails the next read as a broken pipe or device would
class FailingBuf : public std::streambuf {
public:
    explicit FailingBuf(std::string text) : data(std::move(text)) {
        setg(&data[0], &data[0], &data[0] + data.size());
    }

protected:
    int_type underflow() override {
        throw std::runtime_error("read failed");
    }

private:
    std::string data;
};

} // namespace

TEST(Batch, preserves_order_and_continues_after_errors)
{
    Config config;
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processAll({VALID_A, "not-a-uuid", VALID_B});

    EXPECT_EQ(out.str(), "2024-01-31T07:14:26.746Z\n1970-01-01T00:00:01.000Z\n");
    EXPECT_EQ(err.str(), "Error: Invalid UUID: 'not-a-uuid'\n");

    const BatchResult& result = driver.result();
    ASSERT_EQ(result.items.size(), 3u);
    EXPECT_TRUE(result.items[0].ok());
    EXPECT_EQ(result.items[1].error, ExtractError::INVALID_UUID);
    EXPECT_TRUE(result.items[2].ok());
    EXPECT_EQ(result.failureCount(), 1u);
    EXPECT_EQ(driver.finish(), 1);
}

TEST(Batch, all_valid_exits_zero)
{
    Config config;
    config.format = OutputFormat::UNIX_MS;
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processAll({VALID_A, VALID_B});

    EXPECT_EQ(out.str(), "1706685266746\n1000\n");
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(driver.finish(), 0);
}

TEST(Batch, out_of_range_diagnostic)
{
    Config config;
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    EXPECT_EQ(driver.process(OUT_OF_RANGE), ExtractError::TIMESTAMP_OUT_OF_RANGE);
    ASSERT_EQ(driver.result().items.size(), 1u);
    EXPECT_EQ(driver.result().items[0].error, ExtractError::TIMESTAMP_OUT_OF_RANGE);

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Error: Timestamp out of range: '" + OUT_OF_RANGE +
                         "' (supported up to 9999-12-31T23:59:59.999Z)\n");
    EXPECT_EQ(driver.finish(), 1);
}

TEST(Batch, quiet_suppresses_diagnostics)
{
    Config config;
    config.quiet = true;
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processAll({"not-a-uuid", OUT_OF_RANGE, VALID_A});

    EXPECT_EQ(out.str(), "2024-01-31T07:14:26.746Z\n");
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(driver.result().failureCount(), 2u);
    EXPECT_EQ(driver.finish(), 1);
}

TEST(Batch, reads_lines_skipping_blanks)
{
    Config config;
    config.format = OutputFormat::UNIX;
    std::istringstream in(VALID_A + "\r\n\n   \n" + "bogus\r\n" + VALID_B);
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processLines(in);

    EXPECT_EQ(out.str(), "1706685266\n1\n");
    EXPECT_EQ(lineCount(err.str()), 1u);
    EXPECT_NE(err.str().find("'bogus'"), std::string::npos);
    ASSERT_EQ(driver.result().items.size(), 3u);
    EXPECT_EQ(driver.result().items[0].input, VALID_A);
    EXPECT_EQ(driver.finish(), 1);
}

TEST(Batch, read_error_ends_input)
{
    Config config;
    FailingBuf buf(VALID_A + "\n");
    std::istream in(&buf);
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processLines(in);

    EXPECT_TRUE(in.bad());
    EXPECT_EQ(out.str(), "2024-01-31T07:14:26.746Z\n");
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(driver.result().items.size(), 1u);
    EXPECT_EQ(driver.finish(), 0);
}

TEST(Batch, empty_input_fails)
{
    Config config;
    std::istringstream in("\n\n  \n");
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processLines(in);

    EXPECT_TRUE(driver.result().items.empty());
    EXPECT_EQ(driver.finish(), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Error: No UUID provided. Use --help for usage information.\n");
}

TEST(Batch, empty_input_quiet)
{
    Config config;
    config.quiet = true;
    std::ostringstream out;
    std::ostringstream err;
    BatchDriver driver(config, out, err);

    driver.processAll({});

    EXPECT_EQ(driver.finish(), 1);
    EXPECT_TRUE(err.str().empty());
}

TEST(BatchResult, exit_status)
{
    BatchResult result;
    EXPECT_EQ(result.exitStatus(), 1);

    ItemOutcome good;
    result.items.push_back(good);
    EXPECT_EQ(result.exitStatus(), 0);

    ItemOutcome bad;
    bad.error = ExtractError::INVALID_UUID;
    result.items.push_back(bad);
    EXPECT_EQ(result.exitStatus(), 1);
    EXPECT_EQ(result.failureCount(), 1u);
}
