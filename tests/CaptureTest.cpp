#include "Capture.hpp"
#include "FakeUSBAdapter.hpp"
#include <gtest/gtest.h>

class CaptureTest : public ::testing::Test {
protected:
    std::unique_ptr<FakeUSBAdapter> adapter = std::make_unique<FakeUSBAdapter>();
    std::vector<ControlCall> controls;
    std::vector<BulkCall> bulks;
    RunOptions options;

    void SetUp() override {
        adapter->control_log = &controls;
        adapter->bulk_log = &bulks;
    }
};

TEST_F(CaptureTest, ReadsConfigThenFramesAndDisarms) {
    options.frame_count = 2;
    adapter->bulk_results.push_back({0, std::vector<uint8_t>(37, 0x11)});
    adapter->bulk_results.push_back({0, std::vector<uint8_t>(512, 0x22)});
    adapter->bulk_results.push_back({0, std::vector<uint8_t>(100, 0x33)});

    EXPECT_EQ(run_capture(std::move(adapter), options), 0);

    ASSERT_EQ(bulks.size(), 3u);
    EXPECT_EQ(bulks[0].endpoint_address, 0x81);
    EXPECT_EQ(bulks[0].length, 4096);
    EXPECT_EQ(bulks[1].endpoint_address, 0x85);
    EXPECT_EQ(bulks[1].length, 131072);
    EXPECT_EQ(bulks[2].endpoint_address, 0x85);

    ASSERT_EQ(controls.size(), 4u);
    EXPECT_EQ(controls[0].index, 1);
    EXPECT_EQ(controls[0].value, 1);
    EXPECT_EQ(controls[1].index, 2);
    EXPECT_EQ(controls[1].value, 1);
    EXPECT_EQ(controls[2].value, 0);
    EXPECT_EQ(controls[3].value, 0);
}

TEST_F(CaptureTest, MissingCameraFails) {
    adapter->connect_status = FAKE_ERROR_NOT_FOUND;

    EXPECT_EQ(run_capture(std::move(adapter), options), 1);
    EXPECT_TRUE(controls.empty());
    EXPECT_TRUE(bulks.empty());
}

TEST_F(CaptureTest, BulkTimeoutFailsAndStillDisarms) {
    adapter->bulk_results.push_back({FAKE_ERROR_TIMEOUT, {}});

    EXPECT_EQ(run_capture(std::move(adapter), options), 1);
    EXPECT_EQ(bulks.size(), 1u);
    ASSERT_EQ(controls.size(), 4u);
    EXPECT_EQ(controls[3].index, 1);
    EXPECT_EQ(controls[3].value, 0);
}

TEST_F(CaptureTest, BufferAllocationFailureIsReported) {
    options.config_buffer_size = std::vector<uint8_t>().max_size() + 1;

    EXPECT_EQ(run_capture(std::move(adapter), options), 1);
    EXPECT_TRUE(bulks.empty());
    ASSERT_EQ(controls.size(), 4u);
}
