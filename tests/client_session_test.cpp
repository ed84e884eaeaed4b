#include <gtest/gtest.h>
#include "code_context/logging.hpp"
#include "code_context/session/client_session.hpp"
#include "fakes.hpp"
#include <utility>

using namespace code_context;
using code_context::fakes::CountingFileSource;
using code_context::fakes::FakeTransport;
using json = nlohmann::json;

namespace {

CodebaseContext sample_context() {
    CodebaseContext ctx;
    SnapshotNode root = SnapshotNode::directory();
    root.children["a.go"] = SnapshotNode::file();
    root.children["b.go"] = SnapshotNode::file({"Handler"});
    ctx.snapshot["/repo"] = root;
    return ctx;
}

json plan_json(const std::vector<std::pair<std::string, int>>& files,
               const std::vector<std::pair<std::string, int>>& extra = {}) {
    auto entries = [](const std::vector<std::pair<std::string, int>>& list) {
        json arr = json::array();
        for (const auto& [path, op] : list) {
            arr.push_back({{"path", path}, {"operation", op}, {"reason", "needed"}});
        }
        return arr;
    };
    return {{"files", entries(files)}, {"additionalContextFiles", entries(extra)}};
}

std::string path_from_work_prompt(const std::string& prompt) {
    const std::string prefix = "File: ";
    auto end = prompt.find(" (operation:");
    return prompt.substr(prefix.size(), end - prefix.size());
}

// Well-behaved server: acknowledges LOAD, answers SELECT with `plan` and
// every WORK with a patch for the requested file.
FakeTransport::Responder scripted_server(json plan) {
    return [plan](const std::string& sent) {
        auto req = SessionRequest::decode(sent);
        std::vector<InboundFrame> out;
        if (!req) return out;
        switch (req->stage) {
            case Stage::Load:
                out.push_back(InboundFrame::text_frame(
                    make_response(Stage::Load, {{"stage", "load"}, {"status", "ok"}}).encode()));
                break;
            case Stage::Select:
                out.push_back(InboundFrame::text_frame(make_response(Stage::Select, plan).encode()));
                break;
            case Stage::Work: {
                std::string path = path_from_work_prompt(req->file_work_prompt);
                json patch = {{"path", path}, {"patch", "--- a/" + path + "\n+++ b/" + path + "\n"},
                              {"summary", "edit " + path}};
                out.push_back(InboundFrame::text_frame(make_response(Stage::Work, patch).encode()));
                break;
            }
        }
        return out;
    };
}

class ClientSessionTest : public ::testing::Test {
protected:
    FakeTransport transport;
    CountingFileSource files;
    std::shared_ptr<spdlog::logger> log = make_null_logger("client");

    ClientSession make_session() {
        return ClientSession("tester", sample_context(), transport, files, log);
    }

    std::vector<SessionRequest> sent_requests() const {
        std::vector<SessionRequest> out;
        for (const auto& text : transport.sent_texts) {
            auto req = SessionRequest::decode(text);
            if (req) out.push_back(*req);
        }
        return out;
    }
};

} // namespace

TEST_F(ClientSessionTest, SelectBeforeLoadThrows) {
    transport.responder = scripted_server(plan_json({}));
    auto session = make_session();
    EXPECT_THROW(session.select("do something"), StageOrderError);
    EXPECT_TRUE(transport.sent_texts.empty());
    EXPECT_EQ(session.state(), SessionState::Idle);
}

TEST_F(ClientSessionTest, WorkBeforeSelectThrows) {
    transport.responder = scripted_server(plan_json({}));
    auto session = make_session();
    ASSERT_TRUE(session.load());
    EXPECT_THROW(session.work(), StageOrderError);
    EXPECT_EQ(transport.sent_texts.size(), 1u);
}

TEST_F(ClientSessionTest, LoadTwiceThrows) {
    transport.responder = scripted_server(plan_json({}));
    auto session = make_session();
    ASSERT_TRUE(session.load());
    EXPECT_THROW(session.load(), StageOrderError);
}

TEST_F(ClientSessionTest, LoadSendsSnapshotWithoutFileContents) {
    transport.responder = scripted_server(plan_json({}));
    auto session = make_session();
    EXPECT_TRUE(session.load());

    auto requests = sent_requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].stage, Stage::Load);
    EXPECT_EQ(requests[0].client_id, "tester");
    EXPECT_TRUE(requests[0].task_prompt.empty());
    EXPECT_TRUE(requests[0].context.file_contents().empty());
    EXPECT_EQ(requests[0].context.snapshot, sample_context().snapshot);
    EXPECT_EQ(session.state(), SessionState::AwaitingLoadAck);
}

TEST_F(ClientSessionTest, CreateIsNotReadAndUpdateIsReadOnce) {
    files.files["a.go"] = "should never be read\n";
    files.files["b.go"] = "package b\n\nfunc Handler() {}\n";
    transport.responder = scripted_server(plan_json({{"a.go", 1}, {"b.go", 0}}));

    auto session = make_session();
    auto summary = session.run("add a handler");

    EXPECT_EQ(files.reads.count("a.go"), 0u);
    EXPECT_EQ(files.reads["b.go"], 1);
    EXPECT_EQ(session.context().file_contents().at("b.go"), "package b\n\nfunc Handler() {}\n");
    EXPECT_EQ(session.context().file_contents().count("a.go"), 0u);

    ASSERT_EQ(summary.work.size(), 2u);
    EXPECT_EQ(summary.work[0].outcome, StageOutcome::Ok);
    EXPECT_EQ(summary.work[1].outcome, StageOutcome::Ok);
    EXPECT_EQ(summary.work[1].patch->path, "b.go");
    EXPECT_TRUE(summary.load_ok);
    EXPECT_TRUE(summary.select_ok);
    EXPECT_EQ(session.state(), SessionState::Done);
    EXPECT_EQ(summary.close_code, CloseCode::NormalClosure);
}

TEST_F(ClientSessionTest, WorkPromptsFollowPlanOrder) {
    files.files["b.go"] = "package b\nvar Value = 1\n";
    transport.responder = scripted_server(plan_json({{"a.go", 1}, {"b.go", 0}, {"c.go", -1}}));
    files.files["c.go"] = "package c\n";

    auto session = make_session();
    session.run("refactor");

    auto requests = sent_requests();
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(requests[2].stage, Stage::Work);
    EXPECT_EQ(requests[2].file_work_prompt, "File: a.go (operation: create)\n");
    EXPECT_EQ(requests[3].file_work_prompt, "File: b.go (operation: update)\n\n1: package b\n2: var Value = 1\n");
    EXPECT_EQ(requests[4].file_work_prompt, "File: c.go (operation: remove)\n");
    EXPECT_EQ(requests[3].task_prompt, "refactor");
    EXPECT_EQ(requests[3].context.file_contents().at("b.go"), "package b\nvar Value = 1\n");
}

TEST_F(ClientSessionTest, ContextFilesAreReadButNotWorked) {
    files.files["b.go"] = "package b\n";
    files.files["types.go"] = "package b\ntype ID string\n";
    transport.responder = scripted_server(plan_json({{"b.go", 0}}, {{"types.go", 0}}));

    auto session = make_session();
    auto summary = session.run("use ID");

    EXPECT_EQ(files.reads["types.go"], 1);
    EXPECT_TRUE(session.context().has_file_content("types.go"));
    ASSERT_EQ(summary.work.size(), 1u);
    EXPECT_EQ(summary.work[0].file.path, "b.go");
}

TEST_F(ClientSessionTest, UnreadableUpdateIsSkipped) {
    files.files["b.go"] = "package b\n";
    transport.responder = scripted_server(plan_json({{"missing.go", 0}, {"b.go", 0}}));

    auto session = make_session();
    auto summary = session.run("touch both");

    EXPECT_EQ(files.reads["missing.go"], 1);
    ASSERT_EQ(summary.work.size(), 2u);
    EXPECT_EQ(summary.work[0].outcome, StageOutcome::Skipped);
    EXPECT_EQ(summary.work[1].outcome, StageOutcome::Ok);

    size_t work_requests = 0;
    for (const auto& r : sent_requests()) {
        if (r.stage == Stage::Work) work_requests++;
    }
    EXPECT_EQ(work_requests, 1u);
}

TEST_F(ClientSessionTest, InvalidPatchFailsThatFileOnly) {
    files.files["b.go"] = "package b\n";
    auto server = scripted_server(plan_json({{"a.go", 1}, {"b.go", 0}}));
    int work_seen = 0;
    transport.responder = [&](const std::string& sent) {
        auto req = SessionRequest::decode(sent);
        if (req && req->stage == Stage::Work && work_seen++ == 0) {
            json bad = {{"path", "a.go"}, {"diff", "nope"}};
            return std::vector<InboundFrame>{InboundFrame::text_frame(make_response(Stage::Work, bad).encode())};
        }
        return server(sent);
    };

    auto session = make_session();
    auto summary = session.run("two files");

    ASSERT_EQ(summary.work.size(), 2u);
    EXPECT_EQ(summary.work[0].outcome, StageOutcome::Failed);
    EXPECT_FALSE(summary.work[0].error.empty());
    EXPECT_FALSE(summary.work[0].patch.has_value());
    EXPECT_EQ(summary.work[1].outcome, StageOutcome::Ok);
    EXPECT_EQ(session.state(), SessionState::Done);
}

TEST_F(ClientSessionTest, PatchForAnotherFileIsRejected) {
    auto server = scripted_server(plan_json({{"a.go", 1}}));
    transport.responder = [&](const std::string& sent) {
        auto req = SessionRequest::decode(sent);
        if (req && req->stage == Stage::Work) {
            json other = {{"path", "elsewhere.go"}, {"patch", "---"}, {"summary", "wrong file"}};
            return std::vector<InboundFrame>{InboundFrame::text_frame(make_response(Stage::Work, other).encode())};
        }
        return server(sent);
    };

    auto session = make_session();
    auto summary = session.run("create a.go");
    ASSERT_EQ(summary.work.size(), 1u);
    EXPECT_EQ(summary.work[0].outcome, StageOutcome::Failed);
}

TEST_F(ClientSessionTest, RejectedPlanEndsWithoutWork) {
    files.files["a.go"] = "package a\n";
    // Same path in both lists
    transport.responder = scripted_server(plan_json({{"a.go", 0}}, {{"a.go", 0}}));

    auto session = make_session();
    auto summary = session.run("conflicting plan");

    EXPECT_FALSE(summary.select_ok);
    EXPECT_TRUE(summary.work.empty());
    EXPECT_TRUE(files.reads.empty());
    EXPECT_TRUE(session.context().file_contents().empty());
    EXPECT_EQ(session.state(), SessionState::Done);
}

TEST_F(ClientSessionTest, FailedAckStillAdvances) {
    auto server = scripted_server(plan_json({}));
    transport.responder = [&](const std::string& sent) {
        auto req = SessionRequest::decode(sent);
        if (req && req->stage == Stage::Load) {
            return std::vector<InboundFrame>{InboundFrame::text_frame(
                make_error_response(Stage::Load, status::kInvalidModelResponse, "no JSON").encode())};
        }
        return server(sent);
    };

    auto session = make_session();
    EXPECT_FALSE(session.load());
    auto plan = session.select("continue anyway");
    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(session.state(), SessionState::Done);
}

TEST_F(ClientSessionTest, UndecodableFramesAreDropped) {
    auto server = scripted_server(plan_json({}));
    transport.responder = [&](const std::string& sent) {
        auto frames = server(sent);
        frames.insert(frames.begin(), InboundFrame::text_frame("garbage {"));
        return frames;
    };

    auto session = make_session();
    EXPECT_TRUE(session.load());
}

TEST_F(ClientSessionTest, StageMismatchIsMalformed) {
    transport.responder = [](const std::string&) {
        return std::vector<InboundFrame>{InboundFrame::text_frame(
            make_response(Stage::Select, {{"stage", "load"}, {"status", "ok"}}).encode())};
    };

    auto session = make_session();
    EXPECT_FALSE(session.load());
}

TEST_F(ClientSessionTest, ServerCloseEndsConversation) {
    auto server = scripted_server(plan_json({{"b.go", 0}}));
    transport.responder = [&](const std::string& sent) {
        auto req = SessionRequest::decode(sent);
        if (req && req->stage == Stage::Select) {
            return std::vector<InboundFrame>{
                InboundFrame::close_frame(CloseCode::InternalServerError, "model unavailable")};
        }
        return server(sent);
    };

    auto session = make_session();
    auto summary = session.run("anything");

    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_EQ(summary.close_code, CloseCode::InternalServerError);
    EXPECT_EQ(summary.close_reason, "model unavailable");
    EXPECT_TRUE(summary.work.empty());
    EXPECT_TRUE(transport.sent_closes.empty());
    EXPECT_EQ(exit_code_for(*summary.close_code), 4);
}

TEST_F(ClientSessionTest, BrokenStreamIsAbnormal) {
    transport.responder = [](const std::string&) { return std::vector<InboundFrame>{}; };

    auto session = make_session();
    EXPECT_FALSE(session.load());
    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_EQ(session.close_code(), CloseCode::AbnormalClosure);
}

TEST_F(ClientSessionTest, RequestedCloseStopsBeforeNextRequest) {
    transport.responder = scripted_server(plan_json({{"a.go", 1}}));
    auto session = make_session();
    ASSERT_TRUE(session.load());

    session.request_close();
    auto plan = session.select("never sent");

    EXPECT_TRUE(plan.empty());
    EXPECT_EQ(transport.sent_texts.size(), 1u);
    ASSERT_EQ(transport.sent_closes.size(), 1u);
    EXPECT_EQ(transport.sent_closes[0].code, CloseCode::NormalClosure);
    EXPECT_EQ(session.state(), SessionState::Closed);
    EXPECT_EQ(session.close_code(), CloseCode::NormalClosure);

    // Further stages are no-ops once closed
    EXPECT_TRUE(session.work().empty());
}

TEST_F(ClientSessionTest, RunEndsWithNormalClose) {
    transport.responder = scripted_server(plan_json({}));
    auto session = make_session();
    auto summary = session.run("nothing to do");

    ASSERT_EQ(transport.sent_closes.size(), 1u);
    EXPECT_EQ(transport.sent_closes[0].code, CloseCode::NormalClosure);
    EXPECT_EQ(summary.close_code, CloseCode::NormalClosure);
    EXPECT_EQ(session.state(), SessionState::Done);
}

TEST_F(ClientSessionTest, Latin1FileIsSentWithReplacementCharacter) {
    files.files["b.go"] = "package b // caf\xe9\n";
    transport.responder = scripted_server(plan_json({{"b.go", 0}}));

    auto session = make_session();
    SessionSummary summary;
    EXPECT_NO_THROW(summary = session.run("translate comments"));

    ASSERT_EQ(summary.work.size(), 1u);
    EXPECT_EQ(summary.work[0].outcome, StageOutcome::Ok);
    EXPECT_EQ(summary.close_code, CloseCode::NormalClosure);

    // Local copy keeps the raw bytes, the wire copy carries U+FFFD
    EXPECT_EQ(session.context().file_contents().at("b.go"), "package b // caf\xe9\n");
    auto requests = sent_requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[2].context.file_contents().at("b.go"), "package b // caf\xef\xbf\xbd\n");
    EXPECT_EQ(requests[2].file_work_prompt,
              "File: b.go (operation: update)\n\n1: package b // caf\xef\xbf\xbd\n");
}
