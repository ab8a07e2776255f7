#include "../test_utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <gtest/gtest.h>
#include <mcpbridge/errors.hpp>
#include <mcpbridge/transport.hpp>
#include <thread>

using namespace mcpbridge;
using namespace std::chrono_literals;

namespace
{

LaunchSpec shell(const std::string& script)
{
    LaunchSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    return spec;
}

} // namespace

TEST(ProcessTransportTest, WriteAndReadLine)
{
    auto transport = create_process_transport();
    transport->start(shell("cat"));

    transport->write_line(R"({"id":1})", 2000ms);
    EXPECT_EQ(transport->read_line(2000ms), "{\"id\":1}\n");
    EXPECT_TRUE(transport->is_running());
    EXPECT_GT(transport->get_pid(), 0);

    transport->terminate(500ms);
    EXPECT_FALSE(transport->is_running());
}

TEST(ProcessTransportTest, ReassemblesWithOneByteChunks)
{
    TransportOptions options;
    options.read_chunk_size = 1;
    auto transport = create_process_transport(options);
    transport->start(shell("printf 'first line\\nsecond'; sleep 0.2; printf ' line\\n'; sleep 5"));

    EXPECT_EQ(transport->read_line(2000ms), "first line\n");
    EXPECT_EQ(transport->read_line(2000ms), "second line\n");

    transport->terminate(500ms);
}

TEST(ProcessTransportTest, TrickledResponseIsOneLine)
{
    auto transport = create_process_transport();
    transport->start(test::stub_launch("trickle"));

    transport->write_line(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"x"}})",
        2000ms);
    std::string line = transport->read_line(5000ms);

    auto parsed = json::parse(line);
    EXPECT_EQ(parsed["id"], 1);
    EXPECT_EQ(parsed["result"]["serverInfo"]["name"], "stub");

    transport->terminate(500ms);
}

TEST(ProcessTransportTest, ReadTimesOutWithoutNewline)
{
    auto transport = create_process_transport();
    transport->start(shell("printf 'no newline'; sleep 5"));

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(transport->read_line(200ms), TimeoutExpired);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 2000ms);

    // The partial bytes stay buffered; the process is still usable
    EXPECT_TRUE(transport->is_running());
    transport->terminate(500ms);
}

TEST(ProcessTransportTest, EofIsPrematureEOF)
{
    auto transport = create_process_transport();
    transport->start(shell("exit 0"));
    EXPECT_THROW(transport->read_line(2000ms), PrematureEOF);
}

TEST(ProcessTransportTest, EofMidLineIsPrematureEOF)
{
    auto transport = create_process_transport();
    transport->start(shell("printf 'half a li'"));
    EXPECT_THROW(transport->read_line(2000ms), PrematureEOF);
}

TEST(ProcessTransportTest, LinesBeforeEofAreDelivered)
{
    auto transport = create_process_transport();
    transport->start(shell("printf 'one\\ntwo\\n'"));

    EXPECT_EQ(transport->read_line(2000ms), "one\n");
    EXPECT_EQ(transport->read_line(2000ms), "two\n");
    EXPECT_THROW(transport->read_line(2000ms), PrematureEOF);
}

TEST(ProcessTransportTest, OverlongLineIsDecodeError)
{
    TransportOptions options;
    options.max_line_size = 1024;
    auto transport = create_process_transport(options);
    transport->start(shell("head -c 4096 /dev/zero | tr '\\0' 'x'; sleep 5"));

    EXPECT_THROW(transport->read_line(2000ms), JSONDecodeError);
    transport->terminate(500ms);
}

TEST(ProcessTransportTest, MissingExecutableIsLaunchError)
{
    auto transport = create_process_transport();
    LaunchSpec spec;
    spec.argv = {"this_should_not_exist_12345"};
    EXPECT_THROW(transport->start(spec), LaunchError);
}

TEST(ProcessTransportTest, EmptyCommandIsLaunchError)
{
    auto transport = create_process_transport();
    EXPECT_THROW(transport->start(LaunchSpec{}), LaunchError);
}

TEST(ProcessTransportTest, WriteAfterChildExitIsTransportClosed)
{
    auto transport = create_process_transport();
    transport->start(shell("exit 0"));
    EXPECT_THROW(transport->read_line(2000ms), PrematureEOF);

    // The first write may land in the pipe buffer before EPIPE is seen
    EXPECT_THROW(
        {
            for (int i = 0; i < 100; ++i)
                transport->write_line(std::string(64 * 1024, 'x'), 2000ms);
        },
        TransportClosed);
}

TEST(ProcessTransportTest, WriteAfterTerminateIsTransportClosed)
{
    auto transport = create_process_transport();
    transport->start(shell("cat"));
    transport->terminate(500ms);
    EXPECT_THROW(transport->write_line("{}", 2000ms), TransportClosed);
}

TEST(ProcessTransportTest, TerminateIsIdempotent)
{
    auto transport = create_process_transport();
    transport->start(shell("cat"));

    EXPECT_NO_THROW(transport->terminate(500ms));
    EXPECT_NO_THROW(transport->terminate(500ms));
    EXPECT_FALSE(transport->is_running());
}

TEST(ProcessTransportTest, TerminateBeforeStartIsNoOp)
{
    auto transport = create_process_transport();
    EXPECT_NO_THROW(transport->terminate(100ms));
}

TEST(ProcessTransportTest, TerminateEscalatesToKill)
{
    auto transport = create_process_transport();
    transport->start(test::stub_launch("ignore-term"));

    auto start = std::chrono::steady_clock::now();
    transport->terminate(300ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(transport->is_running());
    EXPECT_LT(elapsed, 3000ms);
}

TEST(ProcessTransportTest, CancelUnblocksReader)
{
    auto transport = create_process_transport();
    transport->start(shell("sleep 10"));

    std::thread canceller(
        [&]
        {
            std::this_thread::sleep_for(100ms);
            transport->cancel();
        });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(transport->read_line(10000ms), OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);

    canceller.join();
    transport->terminate(500ms);
}

TEST(ProcessTransportTest, WriteToChildNotReadingTimesOut)
{
    auto transport = create_process_transport();
    transport->start(shell("sleep 10"));

    // Larger than any pipe buffer, and nobody reads it
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(transport->write_line(std::string(1 << 20, 'x'), 300ms), TimeoutExpired);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);

    transport->terminate(500ms);
}

TEST(ProcessTransportTest, CancelUnblocksWriter)
{
    auto transport = create_process_transport();
    transport->start(shell("sleep 10"));

    std::thread canceller(
        [&]
        {
            std::this_thread::sleep_for(100ms);
            transport->cancel();
        });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(transport->write_line(std::string(1 << 20, 'x'), 10000ms), OperationCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);

    canceller.join();
    transport->terminate(500ms);
}

TEST(ProcessTransportTest, TerminateDuringBlockedWriteReturnsPromptly)
{
    auto transport = create_process_transport();
    transport->start(shell("sleep 10"));

    std::atomic<bool> threw{false};
    std::thread writer(
        [&]
        {
            try
            {
                transport->write_line(std::string(1 << 20, 'x'), 10000ms);
            }
            catch (const BridgeError&)
            {
                threw = true;
            }
        });

    std::this_thread::sleep_for(100ms);
    auto start = std::chrono::steady_clock::now();
    transport->terminate(500ms);
    writer.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3000ms);
    EXPECT_TRUE(threw);
    EXPECT_FALSE(transport->is_running());
}

TEST(ProcessTransportTest, StderrIsForwardedAndDoesNotBlock)
{
    test::CapturedLines captured;
    TransportOptions options;
    options.stderr_callback = [&captured](const std::string& line) { captured.add(line); };

    auto transport = create_process_transport(options);
    // Far more stderr than a pipe buffer holds, then one stdout line
    transport->start(shell("i=0; while [ $i -lt 5000 ]; do echo \"diagnostic line $i\" 1>&2; "
                           "i=$((i+1)); done; echo done"));

    EXPECT_EQ(transport->read_line(5000ms), "done\n");
    transport->terminate(500ms);

    EXPECT_TRUE(captured.contains("diagnostic line 0"));
    EXPECT_TRUE(captured.contains("diagnostic line 4999"));
}

TEST(ProcessTransportTest, WorkingDirectoryAndEnvironment)
{
    LaunchSpec spec = shell("echo \"$(pwd) $BRIDGE_TEST_VAR\"");
    spec.working_directory = "/";
    spec.environment["BRIDGE_TEST_VAR"] = "hello";

    auto transport = create_process_transport();
    transport->start(spec);
    EXPECT_EQ(transport->read_line(2000ms), "/ hello\n");
}

TEST(ProcessTransportTest, DestructorReapsChild)
{
    long pid = 0;
    {
        auto transport = create_process_transport();
        transport->start(shell("sleep 10"));
        pid = transport->get_pid();
        EXPECT_GT(pid, 0);
    }
    // kill(pid, 0) fails once the child is reaped
    EXPECT_NE(::kill(static_cast<pid_t>(pid), 0), 0);
}
