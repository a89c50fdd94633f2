/**
 * @file test_main.cpp
 * @brief GoogleTest entry point
 *
 * Qt objects under test (timers, sockets, signals) expect a
 * QCoreApplication, so the runner owns one for the whole process.
 */

#include <gtest/gtest.h>

#include <QCoreApplication>

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
