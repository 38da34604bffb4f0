#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "cli.hpp"
#include "fake_transport.hpp"
#include "settings.hpp"

namespace fs = std::filesystem;
using testing_support::json_reply;
using testing_support::path_is;

namespace {

transport::HttpResult relay(const transport::HttpRequest& request) {
    if (path_is(request, "resolveCode")) {
        if (request.body == "code=123456") return json_reply(R"({"success": true})");
        return json_reply(R"({"success": false, "msg": "验证码不存在"})");
    }
    if (path_is(request, "upload")) return json_reply(R"({"success": true})");
    if (path_is(request, "getFileListForDownCode")) {
        return json_reply(R"({"success": true, "data": [{"id": 1, "fileName": "a.txt"}, {"id": 2, "fileName": "b.bin"}]})");
    }
    if (path_is(request, "downLoadFile")) return json_reply("file body");
    return json_reply("", 404);
}

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("relaydrop_cli_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        fake_ = std::make_shared<testing_support::FakeTransport>(relay);
    }

    void TearDown() override { fs::remove_all(dir_); }

    std::string config_path() const { return (dir_ / "config.ini").string(); }

    void set_host(const std::string& host) { config::ConfigStore(config_path()).save_host(host); }

    int run(const std::string& command, std::vector<std::string> args, const std::string& input = "") {
        cli::Invocation inv;
        inv.config_path = config_path();
        inv.command = command;
        inv.args = std::move(args);
        out_.str("");
        err_.str("");
        std::istringstream in(input);
        return cli::run(inv, in, out_, err_, fake_);
    }

    bool err_has(const std::string& text) const { return err_.str().find(text) != std::string::npos; }

    fs::path dir_;
    std::shared_ptr<testing_support::FakeTransport> fake_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

TEST(CliArgs, ParsesConfigOptionAndCommand) {
    cli::Invocation inv;
    ASSERT_TRUE(cli::parse_args({"--config", "/tmp/x.ini", "list", "123456"}, inv));
    EXPECT_EQ(inv.config_path, "/tmp/x.ini");
    EXPECT_EQ(inv.command, "list");
    EXPECT_EQ(inv.args, (std::vector<std::string>{"123456"}));

    cli::Invocation empty;
    ASSERT_TRUE(cli::parse_args({}, empty));
    EXPECT_TRUE(empty.command.empty());

    cli::Invocation bad;
    EXPECT_FALSE(cli::parse_args({"--verbose", "list"}, bad));
    EXPECT_FALSE(cli::parse_args({"--config"}, bad));
}

TEST_F(CliTest, UnknownCommandPrintsUsage) {
    EXPECT_EQ(run("frobnicate", {}), cli::EXIT_USAGE);
    EXPECT_TRUE(err_has("Usage: relaydrop"));
    EXPECT_EQ(run("list", {}), cli::EXIT_USAGE);
}

TEST_F(CliTest, HostIsValidatedAndSaved) {
    EXPECT_EQ(run("host", {"not a host"}), cli::EXIT_FAILURE_OP);
    EXPECT_TRUE(err_has("[配置] 服务器地址格式不正确，请重新输入。"));

    EXPECT_EQ(run("host", {"https://Relay.Example.com:9000/"}), cli::EXIT_OK);
    EXPECT_EQ(config::ConfigStore(config_path()).load_all().host, "relay.example.com:9000");
    EXPECT_TRUE(err_has("[配置] 已设置服务器地址：relay.example.com:9000"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(CliTest, ResolveNeedsHost) {
    EXPECT_EQ(run("resolve", {"123456"}), cli::EXIT_FAILURE_OP);
    EXPECT_TRUE(err_has("请先执行 relaydrop host <地址> 进行设置"));
    EXPECT_TRUE(fake_->requests().empty());
}

TEST_F(CliTest, ResolveReportsValidity) {
    set_host("relay.example.com");

    EXPECT_EQ(run("resolve", {"123456"}), cli::EXIT_OK);
    EXPECT_TRUE(err_has("[验证] 成功！验证码 123456 有效。"));

    EXPECT_EQ(run("resolve", {"999999"}), cli::EXIT_FAILURE_OP);
    EXPECT_TRUE(err_has("[验证] 失败：验证码不存在"));

    EXPECT_EQ(run("resolve", {"12ab56"}), cli::EXIT_USAGE);
    EXPECT_TRUE(err_has("[验证] 验证码必须为6位数字，请检查。"));
}

TEST_F(CliTest, ListPrintsTabSeparatedRecords) {
    set_host("relay.example.com");

    EXPECT_EQ(run("list", {"123456"}), cli::EXIT_OK);
    EXPECT_EQ(out_.str(), "1\ta.txt\n2\tb.bin\n");
}

TEST_F(CliTest, UploadTextReadsInput) {
    set_host("relay.example.com");

    EXPECT_EQ(run("upload-text", {"123456"}, "from stdin\n"), cli::EXIT_OK);
    EXPECT_EQ(fake_->uploads(), (std::vector<std::string>{"from stdin\n"}));

    EXPECT_EQ(run("upload-text", {"123456"}, "   \n"), cli::EXIT_FAILURE_OP);
    EXPECT_TRUE(err_has("[上传] 失败，当前文本框为空。"));
}

TEST_F(CliTest, UploadFiles) {
    set_host("relay.example.com");
    fs::path file = dir_ / "notes.md";
    std::ofstream(file) << "# notes";

    EXPECT_EQ(run("upload", {"123456", file.string()}), cli::EXIT_OK);
    EXPECT_EQ(fake_->uploads(), (std::vector<std::string>{"# notes"}));
    EXPECT_TRUE(err_has("[上传] 成功，文件名为「notes.md」"));

    EXPECT_EQ(run("upload", {"123456", (dir_ / "gone.bin").string()}), cli::EXIT_FAILURE_OP);
}

TEST_F(CliTest, DownloadIntoDirectoryUsesRemoteName) {
    set_host("relay.example.com");

    EXPECT_EQ(run("download", {"123456", dir_.string(), "1"}), cli::EXIT_OK);

    std::ifstream in(dir_ / "a.txt");
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "file body");
}

TEST_F(CliTest, DownloadKeepsRemoteNameInsideDirectory) {
    set_host("relay.example.com");
    fs::path downloads = dir_ / "downloads";
    fs::create_directories(downloads);

    auto reply_with_name = [](const std::string& file_name) {
        return [file_name](const transport::HttpRequest& request) {
            if (path_is(request, "getFileListForDownCode")) {
                return json_reply(R"({"success": true, "data": [{"id": 7, "fileName": ")" + file_name + R"("}]})");
            }
            return relay(request);
        };
    };

    fake_->set_reply(reply_with_name("../escaped.txt"));
    EXPECT_EQ(run("download", {"123456", downloads.string(), "7"}), cli::EXIT_OK);
    EXPECT_FALSE(fs::exists(dir_ / "escaped.txt"));
    EXPECT_TRUE(fs::exists(downloads / "escaped.txt"));

    std::string absolute = (dir_ / "abs.txt").string();
    fake_->set_reply(reply_with_name(absolute));
    EXPECT_EQ(run("download", {"123456", downloads.string(), "7"}), cli::EXIT_OK);
    EXPECT_FALSE(fs::exists(absolute));
    EXPECT_TRUE(fs::exists(downloads / "abs.txt"));

    fake_->set_reply(reply_with_name(".."));
    EXPECT_EQ(run("download", {"123456", downloads.string(), "7"}), cli::EXIT_OK);
    EXPECT_TRUE(fs::exists(downloads / "7"));
}

TEST_F(CliTest, DownloadSeveralBecomesArchive) {
    set_host("relay.example.com");

    EXPECT_EQ(run("download", {"123456", dir_.string(), "1", "2"}), cli::EXIT_OK);

    int archives = 0;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        std::string name = entry.path().filename().u8string();
        if (name.rfind("选中文件打包_", 0) == 0 && entry.path().extension() == ".zip") ++archives;
    }
    EXPECT_EQ(archives, 1);

    auto requests = fake_->requests();
    EXPECT_EQ(requests.back().body, "fileIds=1%2C2");
}

TEST_F(CliTest, CatWritesDecodedText) {
    set_host("relay.example.com");

    EXPECT_EQ(run("cat", {"123456", "1"}), cli::EXIT_OK);
    EXPECT_EQ(out_.str(), "file body");
    EXPECT_TRUE(err_has("[加载] 完成，文件「a.txt」已加载到文本输入框。"));
}

TEST(CliMain, NoCommandWithoutDesktopClientIsUsageError) {
    std::istringstream in;
    std::ostringstream out, err;
    EXPECT_EQ(cli::run_main({}, in, out, err), cli::EXIT_USAGE);
    EXPECT_NE(err.str().find("Usage: relaydrop"), std::string::npos);
    EXPECT_TRUE(out.str().empty());

    err.str("");
    EXPECT_EQ(cli::run_main({"--config"}, in, out, err), cli::EXIT_USAGE);
    EXPECT_NE(err.str().find("Usage: relaydrop"), std::string::npos);
}

TEST(CliMain, NoCommandLaunchesDesktopClientWithConfigPath) {
    std::istringstream in;
    std::ostringstream out, err;
    std::vector<std::string> launched;
    auto launcher = [&launched](const std::string& path) {
        launched.push_back(path);
        return 7;
    };

    EXPECT_EQ(cli::run_main({"--config", "/tmp/relaydrop_gui.ini"}, in, out, err, launcher), 7);
    ASSERT_EQ(launched.size(), 1u);
    EXPECT_EQ(launched[0], "/tmp/relaydrop_gui.ini");

    EXPECT_EQ(cli::run_main({}, in, out, err, launcher), 7);
    ASSERT_EQ(launched.size(), 2u);
    EXPECT_EQ(launched[1], config::default_config_path());
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, CommandsNeverReachTheLauncher) {
    std::istringstream in;
    bool launched = false;
    auto launcher = [&launched](const std::string&) {
        launched = true;
        return 0;
    };

    EXPECT_EQ(cli::run_main({"--config", config_path(), "frobnicate"}, in, out_, err_, launcher),
              cli::EXIT_USAGE);
    EXPECT_FALSE(launched);
    EXPECT_TRUE(err_has("Usage: relaydrop"));
}
