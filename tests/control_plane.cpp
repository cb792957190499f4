#include "bookhound/daemon/ControlPlane.hpp"
#include "fake_peers.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using namespace bookhound;

int main() {
    const auto downloads = std::filesystem::temp_directory_path() / "bookhound_control_test";
    std::filesystem::remove_all(downloads);

    test::FakeDccServer peer(std::string(1000, 'Q'));
    test::FakeIrcServer irc;
    irc.set_channel_handler([&](const std::string& nick, const std::string& text) -> std::vector<std::string> {
        if (text == "@search Isaac Asimov Foundation") {
            return {
                ":Bot!bot@test PRIVMSG #ebooks :!Ook Isaac Asimov - Foundation.epub ::INFO:: 1.2MB",
                ":Bot!bot@test PRIVMSG #ebooks :!Bsk Isaac Asimov - Foundation.mobi ::INFO:: 900KB",
            };
        }
        if (text.rfind("!Good ", 0) == 0) {
            return {":Good!bot@test PRIVMSG " + nick + " :" + peer.offer_line("Foundation.epub")};
        }
        return {};
    });

    auto defaults = test::loopback_config(irc.port(), downloads.string());
    defaults.control_token = "hunter2";

    session::SessionRegistry registry;
    std::atomic<int> stop_requests{0};
    daemon::ControlServer server(registry, defaults, [&]() { ++stop_requests; });
    server.start("127.0.0.1", 0);
    assert(server.running());
    assert(server.port() != 0);

    // PING needs no token.
    daemon::ControlClient anonymous("127.0.0.1", server.port());
    const auto ping = anonymous.send("PING");
    assert(ping && ping->success);
    assert(ping->field("CODE") == "OK_PING");

    const auto unauthenticated = anonymous.send("SESSIONS");
    assert(unauthenticated && !unauthenticated->success);
    assert(unauthenticated->field("CODE") == "ERR_AUTH_REQUIRED");

    daemon::ControlClient wrong("127.0.0.1", server.port(), std::string("hunter3"));
    const auto rejected = wrong.send("SESSIONS");
    assert(rejected && !rejected->success);
    assert(rejected->field("CODE") == "ERR_AUTH_FAILED");

    daemon::ControlClient client("127.0.0.1", server.port(), std::string("hunter2"));
    const auto created = client.send("CREATE_SESSION");
    assert(created && created->success);
    assert(created->field("CODE") == "OK_CREATE_SESSION");
    assert(created->field("CONNECTED") == "1");
    const auto session_id = created->field("SESSION_ID");
    assert(session_id.rfind("irc_session_", 0) == 0);

    const auto overview = client.send("STATUS");
    assert(overview && overview->success);
    assert(overview->field("SESSIONS") == "1");
    assert(overview->field("CONTROL_PORT") == std::to_string(server.port()));

    const auto detail = client.send("STATUS", {{"SESSION_ID", session_id}});
    assert(detail && detail->success);
    assert(detail->field("STATE") == "ready");
    assert(detail->field("JOINED") == "1");
    assert(detail->field("CHANNEL") == "#ebooks");
    assert(detail->field("NICKNAME") == irc.nickname());
    assert(detail->has_payload);

    const auto listing = client.send("SESSIONS");
    assert(listing && listing->success);
    assert(listing->field("COUNT") == "1");
    assert(listing->payload_text().rfind(session_id + "\tready\t", 0) == 0);

    const auto search = client.send("SEARCH", {{"SESSION_ID", session_id}, {"AUTHOR", "Isaac Asimov"}, {"TITLE", "Foundation"}});
    assert(search && search->success);
    assert(search->field("CODE") == "OK_SEARCH");
    assert(search->field("QUERY") == "@search Isaac Asimov Foundation");
    assert(search->field("COUNT") == "2");
    const auto records = daemon::decode_records(search->payload_text());
    assert(records.size() == 2);
    assert(records.front().record.server_tag == "Ook");
    assert(records.front().record.reply_command == "!Ook Isaac Asimov - Foundation.epub");
    assert(records.front().score >= records.back().score);

    const auto missing_author = client.send("SEARCH", {{"SESSION_ID", session_id}});
    assert(missing_author && !missing_author->success);
    assert(missing_author->field("CODE") == "ERR_MISSING_ARGUMENT");

    const auto download = client.send("DOWNLOAD",
                                      {{"SESSION_ID", session_id}, {"COMMAND_TEXT", "!Good Isaac Asimov - Foundation.epub"}});
    assert(download && download->success);
    assert(download->field("CODE") == "OK_DOWNLOAD");
    assert(download->field("ATTEMPT") == "1");
    assert(download->field("USED_SERVER") == "Good");
    assert(download->field("BYTES") == "1000");
    assert(std::filesystem::file_size(download->field("PATH")) == 1000);

    const auto nothing = client.send("DOWNLOAD", {{"SESSION_ID", session_id}});
    assert(nothing && !nothing->success);
    assert(nothing->field("CODE") == "ERR_DOWNLOAD_FAILED");
    assert(nothing->field("MESSAGE") == "No candidates provided");

    const auto unknown = client.send("STATUS", {{"SESSION_ID", "irc_session_missing"}});
    assert(unknown && !unknown->success);
    assert(unknown->field("CODE") == "ERR_UNKNOWN_SESSION");

    const auto unsupported = client.send("REBOOT");
    assert(unsupported && !unsupported->success);
    assert(unsupported->field("CODE") == "ERR_UNSUPPORTED_COMMAND");

    const auto bad_port = client.send("CREATE_SESSION", {{"PORT", "70000"}});
    assert(bad_port && !bad_port->success);
    assert(bad_port->field("CODE") == "ERR_INVALID_ARGUMENT");

    const auto closed = client.send("CLOSE_SESSION", {{"SESSION_ID", session_id}});
    assert(closed && closed->success);
    assert(closed->field("CLOSED") == "1");
    assert(irc.wait_for("QUIT", 2s));
    const auto closed_again = client.send("CLOSE_SESSION", {{"SESSION_ID", session_id}});
    assert(closed_again && !closed_again->success);
    assert(closed_again->field("CODE") == "ERR_UNKNOWN_SESSION");
    assert(registry.size() == 0);

    const auto stopped = client.send("STOP");
    assert(stopped && stopped->success);
    assert(stopped->field("CODE") == "OK_STOP");
    assert(stop_requests.load() == 1);

    server.stop();
    assert(!server.running());
    assert(!client.send("PING").has_value());

    std::filesystem::remove_all(downloads);
    return 0;
}
