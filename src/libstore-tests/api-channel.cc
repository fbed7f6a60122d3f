#include <gtest/gtest.h>

#include "arbor/store/build/api-channel.hh"
#include "arbor/util/file-descriptor.hh"

#include <sys/socket.h>
#include <unistd.h>

namespace arbor {

using nlohmann::json;

class ApiChannelTest : public ::testing::Test
{
protected:
    std::vector<json> exceptions;
    json metadata = json::object();
    std::vector<std::string> logLines;
    std::vector<std::pair<uint64_t, uint64_t>> progress;

    AutoCloseFD stageSide;
    std::unique_ptr<ApiChannel> channel;

    void SetUp() override
    {
        SocketPair pair;
        pair.create();
        stageSide = std::move(pair.childSide);
        channel = std::make_unique<ApiChannel>(
            std::move(pair.parentSide),
            ApiHandlers{
                .exception = [this](const json & data) { exceptions.push_back(data); },
                .metadata = [this](const json & data) { metadata.update(data); },
                .log = [this](const std::string & text) { logLines.push_back(text); },
                .progress = [this](uint64_t done, uint64_t expected) { progress.emplace_back(done, expected); },
                .loopAttach = [](const json & data) -> json {
                    if (!data.contains("filename"))
                        throw Error("no backing file given");
                    return {{"path", "/dev/loop7"}};
                },
            });
    }

    void send(const std::string & s)
    {
        writeFull(stageSide.get(), s);
    }

    json readReply()
    {
        std::string line;
        char c;
        while (read(stageSide.get(), &c, 1) == 1 && c != '\n')
            line += c;
        return json::parse(line);
    }
};

TEST_F(ApiChannelTest, notificationsReachHandlers)
{
    send(R"({"type": "log", "data": "installing packages"})" "\n");
    send(R"({"type": "progress", "data": {"done": 3, "expected": 10}})" "\n");
    send(R"({"type": "metadata", "data": {"rpm": {"packages": 42}}})" "\n");
    channel->receive();

    ASSERT_EQ(logLines, std::vector<std::string>{"installing packages"});
    ASSERT_EQ(progress.size(), 1u);
    ASSERT_EQ(progress[0], std::make_pair((uint64_t) 3, (uint64_t) 10));
    ASSERT_EQ(metadata["rpm"]["packages"], 42);
}

TEST_F(ApiChannelTest, messagesMaySpanReads)
{
    send(R"({"type": "log", "da)");
    channel->receive();
    ASSERT_TRUE(logLines.empty());

    send(R"(ta": "second half"})" "\n");
    channel->receive();
    ASSERT_EQ(logLines, std::vector<std::string>{"second half"});
}

TEST_F(ApiChannelTest, finalLineWithoutNewlineIsHandledAtEOF)
{
    send(R"({"type": "exception", "data": {"type": "RuntimeError", "value": "boom"}})");
    stageSide.close();

    while (!channel->atEOF())
        channel->receive();

    ASSERT_EQ(exceptions.size(), 1u);
    ASSERT_EQ(exceptions[0]["value"], "boom");
}

TEST_F(ApiChannelTest, requestsAreAnswered)
{
    send(R"({"id": 1, "type": "loop-attach", "data": {"filename": "disk.img"}})" "\n");
    channel->receive();

    auto reply = readReply();
    ASSERT_EQ(reply["id"], 1);
    ASSERT_EQ(reply["result"]["path"], "/dev/loop7");
}

TEST_F(ApiChannelTest, handlerErrorsBecomeErrorReplies)
{
    send(R"({"id": 2, "type": "loop-attach", "data": {}})" "\n");
    channel->receive();

    auto reply = readReply();
    ASSERT_EQ(reply["id"], 2);
    ASSERT_EQ(reply["error"], "no backing file given");
}

TEST_F(ApiChannelTest, unsupportedRequestsFail)
{
    auto reply = channel->dispatch(json{{"id", 3}, {"type", "loop-detach"}, {"data", {{"device", "/dev/loop7"}}}});
    ASSERT_TRUE(reply);
    ASSERT_TRUE(reply->contains("error"));

    reply = channel->dispatch(json{{"id", 4}, {"type", "reticulate-splines"}});
    ASSERT_TRUE(reply);
    ASSERT_EQ((*reply)["id"], 4);
    ASSERT_TRUE(reply->contains("error"));
}

TEST_F(ApiChannelTest, notificationsGetNoReply)
{
    ASSERT_FALSE(channel->dispatch(json{{"type", "log"}, {"data", "hi"}}));
    ASSERT_FALSE(channel->dispatch(json{{"type", "reticulate-splines"}}));
}

TEST_F(ApiChannelTest, metadataMustBeAnObject)
{
    auto reply = channel->dispatch(json{{"id", 5}, {"type", "metadata"}, {"data", "not an object"}});

    ASSERT_TRUE(reply);
    ASSERT_TRUE(reply->contains("error"));
    ASSERT_TRUE(metadata.empty());
}

TEST_F(ApiChannelTest, malformedLinesAreIgnored)
{
    send("this is not json\n");
    send(R"({"type": "log", "data": "still here"})" "\n");
    channel->receive();

    ASSERT_EQ(logLines, std::vector<std::string>{"still here"});
}

TEST_F(ApiChannelTest, nonStringTypeIsRejected)
{
    auto reply = channel->dispatch(json{{"id", 6}, {"type", 1}});
    ASSERT_TRUE(reply);
    ASSERT_EQ((*reply)["id"], 6);
    ASSERT_NE((*reply)["error"].get<std::string>().find("must be a string"), std::string::npos);

    ASSERT_FALSE(channel->dispatch(json{{"type", json::array()}}));
}

TEST_F(ApiChannelTest, nonStringTypeDoesNotStopTheChannel)
{
    send(R"({"type": 1})" "\n");
    send(R"({"type": "log", "data": "still here"})" "\n");
    ASSERT_NO_THROW(channel->receive());

    ASSERT_EQ(logLines, std::vector<std::string>{"still here"});
}

} // namespace arbor
