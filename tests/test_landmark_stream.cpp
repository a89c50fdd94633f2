/**
 * @file test_landmark_stream.cpp
 * @brief Unit tests for the landmark wire format
 *
 * Validates:
 * - Array and object landmark encodings
 * - Right-hand preference among several hands
 * - Empty hand lists and malformed messages
 * - Sequence and timestamp fields
 * - nextFrame() without a connection
 */

#include <gtest/gtest.h>

#include "core/LandmarkStream.h"

namespace
{
    QByteArray handJson(const char *handedness, float x0)
    {
        QByteArray pts;
        for (int i = 0; i < 21; ++i)
        {
            if (i)
                pts += ",";
            pts += QByteArray("[") + QByteArray::number(x0 + 0.01 * i) + ",0.5,0.0]";
        }
        return QByteArray("{\"handedness\":\"") + handedness + "\",\"landmarks\":[" + pts + "]}";
    }
}

TEST(LandmarkStreamTest, ParsesArrayLandmarks)
{
    const QByteArray line = "{\"seq\":7,\"timestamp_ms\":1700000000123,\"hands\":[" +
                            handJson("Right", 0.1f) + "]}";

    LandmarkFrame frame;
    bool hasHand = false;
    QString error;
    ASSERT_TRUE(LandmarkStream::parseMessage(line, &frame, &hasHand, &error))
        << error.toStdString();

    EXPECT_TRUE(hasHand);
    EXPECT_EQ(frame.sequence, 7u);
    EXPECT_EQ(frame.timestampMs, 1700000000123LL);
    EXPECT_EQ(frame.handedness, "Right");
    ASSERT_EQ(frame.points.size(), 21);
    EXPECT_NEAR(frame.points[0].x, 0.1f, 1e-6);
    EXPECT_NEAR(frame.points[20].x, 0.3f, 1e-6);
    EXPECT_NEAR(frame.points[5].y, 0.5f, 1e-6);
}

TEST(LandmarkStreamTest, ParsesObjectLandmarks)
{
    const QByteArray line =
        "{\"seq\":1,\"hands\":[{\"handedness\":\"Left\",\"landmarks\":"
        "[{\"x\":0.2,\"y\":0.3,\"z\":-0.1},{\"x\":0.4,\"y\":0.6}]}]}";

    LandmarkFrame frame;
    bool hasHand = false;
    ASSERT_TRUE(LandmarkStream::parseMessage(line, &frame, &hasHand));
    ASSERT_TRUE(hasHand);
    ASSERT_EQ(frame.points.size(), 2);
    EXPECT_NEAR(frame.points[0].z, -0.1f, 1e-6);
    EXPECT_NEAR(frame.points[1].y, 0.6f, 1e-6);
    EXPECT_FLOAT_EQ(frame.points[1].z, 0.0f);
}

TEST(LandmarkStreamTest, PrefersRightHand)
{
    const QByteArray line = "{\"seq\":2,\"hands\":[" + handJson("Left", 0.6f) + "," +
                            handJson("Right", 0.1f) + "]}";

    LandmarkFrame frame;
    bool hasHand = false;
    ASSERT_TRUE(LandmarkStream::parseMessage(line, &frame, &hasHand));
    EXPECT_EQ(frame.handedness, "Right");
    EXPECT_NEAR(frame.points[0].x, 0.1f, 1e-6);
}

TEST(LandmarkStreamTest, FallsBackToFirstHand)
{
    const QByteArray line = "{\"hands\":[" + handJson("Left", 0.6f) + "]}";

    LandmarkFrame frame;
    bool hasHand = false;
    ASSERT_TRUE(LandmarkStream::parseMessage(line, &frame, &hasHand));
    EXPECT_TRUE(hasHand);
    EXPECT_EQ(frame.handedness, "Left");
}

TEST(LandmarkStreamTest, EmptyHandsMeansNoHand)
{
    LandmarkFrame frame;
    bool hasHand = true;
    ASSERT_TRUE(LandmarkStream::parseMessage("{\"seq\":3,\"hands\":[]}", &frame, &hasHand));
    EXPECT_FALSE(hasHand);
    EXPECT_EQ(frame.sequence, 3u);
    EXPECT_TRUE(frame.points.isEmpty());

    hasHand = true;
    ASSERT_TRUE(LandmarkStream::parseMessage("{\"seq\":4}", &frame, &hasHand));
    EXPECT_FALSE(hasHand);
}

TEST(LandmarkStreamTest, RejectsMalformedJson)
{
    LandmarkFrame frame;
    bool hasHand = false;
    QString error;
    EXPECT_FALSE(LandmarkStream::parseMessage("{\"hands\":[", &frame, &hasHand, &error));
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(LandmarkStream::parseMessage("[1,2,3]", &frame, &hasHand, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(LandmarkStreamTest, RejectsBadLandmark)
{
    const QByteArray line =
        "{\"hands\":[{\"handedness\":\"Right\",\"landmarks\":[[0.1,0.2],[0.3]]}]}";

    LandmarkFrame frame;
    frame.sequence = 99;
    bool hasHand = false;
    QString error;
    EXPECT_FALSE(LandmarkStream::parseMessage(line, &frame, &hasHand, &error));
    EXPECT_TRUE(error.contains("1"));
    EXPECT_EQ(frame.sequence, 99u); // untouched on failure
}

TEST(LandmarkStreamTest, ShortFrameIsPassedOn)
{
    const QByteArray line =
        "{\"hands\":[{\"handedness\":\"Right\",\"landmarks\":[[0.1,0.2,0.0],[0.3,0.4,0.0]]}]}";

    LandmarkFrame frame;
    bool hasHand = false;
    ASSERT_TRUE(LandmarkStream::parseMessage(line, &frame, &hasHand));
    EXPECT_TRUE(hasHand);
    EXPECT_EQ(frame.points.size(), 2);
}

TEST(LandmarkStreamTest, NoFrameWithoutConnection)
{
    LandmarkStream stream;
    EXPECT_FALSE(stream.isConnected());
    EXPECT_FALSE(stream.nextFrame(10).has_value());
}
