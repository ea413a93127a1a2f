#include "FlirOneProtocol.hpp"
#include <gtest/gtest.h>

TEST(ProtocolTest, ClassifiesTheSixCameraEndpoints) {
    struct Case {
        EndpointDirection direction;
        uint8_t number;
        Channel channel;
    };
    const Case cases[] = {
        {EndpointDirection::In, 1, Channel::Config},
        {EndpointDirection::Out, 2, Channel::Config},
        {EndpointDirection::In, 3, Channel::FileIO},
        {EndpointDirection::Out, 4, Channel::FileIO},
        {EndpointDirection::In, 5, Channel::Frame},
        {EndpointDirection::Out, 6, Channel::Frame},
    };

    for (const auto& c : cases) {
        Channel channel = Channel::Config;
        ASSERT_TRUE(FlirOneProtocol::classify_endpoint(c.direction, c.number, channel)) << int(c.number);
        EXPECT_EQ(channel, c.channel) << int(c.number);
    }
}

TEST(ProtocolTest, RejectsNumbersOutsideTheTopology) {
    Channel channel;
    EXPECT_FALSE(FlirOneProtocol::classify_endpoint(EndpointDirection::In, 0, channel));
    EXPECT_FALSE(FlirOneProtocol::classify_endpoint(EndpointDirection::In, 7, channel));
    EXPECT_FALSE(FlirOneProtocol::classify_endpoint(EndpointDirection::Out, 7, channel));
    EXPECT_FALSE(FlirOneProtocol::classify_endpoint(EndpointDirection::Out, 15, channel));
}

TEST(ProtocolTest, RejectsWrongDirectionForKnownNumbers) {
    Channel channel;
    for (uint8_t n : {1, 3, 5}) {
        EXPECT_FALSE(FlirOneProtocol::classify_endpoint(EndpointDirection::Out, n, channel)) << int(n);
    }
    for (uint8_t n : {2, 4, 6}) {
        EXPECT_FALSE(FlirOneProtocol::classify_endpoint(EndpointDirection::In, n, channel)) << int(n);
    }
}

TEST(ProtocolTest, ChannelIndicesMatchControlWIndex) {
    EXPECT_EQ(FlirOneProtocol::channel_index(Channel::Config), 0);
    EXPECT_EQ(FlirOneProtocol::channel_index(Channel::FileIO), 1);
    EXPECT_EQ(FlirOneProtocol::channel_index(Channel::Frame), 2);
}

TEST(ProtocolTest, ConfigChannelHasNoArmedState) {
    EXPECT_FALSE(FlirOneProtocol::tracks_armed_state(Channel::Config));
    EXPECT_TRUE(FlirOneProtocol::tracks_armed_state(Channel::FileIO));
    EXPECT_TRUE(FlirOneProtocol::tracks_armed_state(Channel::Frame));
}

TEST(ProtocolTest, Names) {
    EXPECT_STREQ(FlirOneProtocol::channel_name(Channel::FileIO), "fileio");
    EXPECT_STREQ(FlirOneProtocol::direction_name(EndpointDirection::Out), "OUT");
}
