#include "cli.hpp"
#include <filesystem>
#include <iostream>
#include <iterator>
#include <boost/algorithm/string/trim.hpp>
#include "activity_log.hpp"
#include "endpoint.hpp"
#include "protocol/remote_file.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "transfer.hpp"

namespace fs = std::filesystem;

namespace cli {

namespace {

struct Context {
    logging::ActivityLog log;
    std::unique_ptr<config::ConfigStore> store;
    std::unique_ptr<transport::Client> client;
    endpoint::ServerEndpoint server;
};

bool require_host(Context& ctx) {
    config::Settings settings = ctx.store->load_all();
    auto parsed = endpoint::parse_endpoint(settings.host);
    if (!parsed) {
        ctx.log.append("[配置] 未检测到服务器地址(HOST)，请先执行 relaydrop host <地址> 进行设置。");
        return false;
    }
    ctx.server = *parsed;
    return true;
}

// Resolves the code once; the server authorizes every other call by it
int unlock(Context& ctx, const std::string& code) {
    if (!session::Session::is_valid_code(code)) {
        ctx.log.append("[验证] 验证码必须为6位数字，请检查。");
        return EXIT_USAGE;
    }
    if (!require_host(ctx)) return EXIT_FAILURE_OP;

    transport::TransferResponse response = ctx.client->resolve_code(ctx.server, code);
    if (!response.ok()) {
        ctx.log.append("[验证] 失败！服务器故障或服务器地址错误。");
        return EXIT_FAILURE_OP;
    }
    if (!protocol::is_success(response.body)) {
        ctx.log.append("[验证] 失败：" + protocol::message_of(response.body));
        return EXIT_FAILURE_OP;
    }
    ctx.log.append("[验证] 成功！验证码 " + code + " 有效。");
    return EXIT_OK;
}

// Records for the requested ids, named from the server listing when possible
std::vector<protocol::RemoteFileRecord> lookup(Context& ctx, const std::string& code,
                                               const std::vector<std::string>& ids) {
    transport::TransferResponse response = ctx.client->list_files(ctx.server, code);
    std::vector<protocol::RemoteFileRecord> listed;
    if (response.ok() && protocol::is_success(response.body)) {
        listed = protocol::parse_file_list(response.body);
    }

    std::vector<protocol::RemoteFileRecord> records;
    for (const auto& id : ids) {
        protocol::RemoteFileRecord record{id, id};
        for (const auto& known : listed) {
            if (known.id == id) {
                record = known;
                break;
            }
        }
        records.push_back(record);
    }
    return records;
}

int cmd_host(Context& ctx, const Invocation& inv) {
    if (inv.args.size() != 1) return EXIT_USAGE;
    std::string raw = boost::algorithm::trim_copy(inv.args[0]);
    if (raw.empty()) {
        ctx.log.append("[配置] 服务器地址不能为空，请输入一个有效的 HOST。");
        return EXIT_FAILURE_OP;
    }
    endpoint::HostCheck check = endpoint::normalize_host(raw);
    if (!check.ok) {
        ctx.log.append("[配置] 服务器地址格式不正确，请重新输入。");
        return EXIT_FAILURE_OP;
    }
    if (!ctx.store->save_host(check.host)) return EXIT_FAILURE_OP;
    ctx.log.append("[配置] 已设置服务器地址：" + check.host);
    return EXIT_OK;
}

int cmd_resolve(Context& ctx, const Invocation& inv) {
    if (inv.args.size() != 1) return EXIT_USAGE;
    return unlock(ctx, inv.args[0]);
}

int cmd_upload(Context& ctx, const Invocation& inv) {
    if (inv.args.size() < 2) return EXIT_USAGE;
    const std::string& code = inv.args[0];
    if (int rc = unlock(ctx, code); rc != EXIT_OK) return rc;

    transfer::Uploader uploader(*ctx.client, ctx.log.callback());
    int rc = EXIT_OK;
    for (std::size_t i = 1; i < inv.args.size(); ++i) {
        const std::string& path = inv.args[i];
        ctx.log.append("[上传] 正在上传文件：" + fs::u8path(path).filename().u8string() + " ...");
        if (!uploader.upload_path(ctx.server, code, path).success) {
            rc = EXIT_FAILURE_OP;
        }
    }
    return rc;
}

int cmd_upload_text(Context& ctx, const Invocation& inv, std::istream& in) {
    if (inv.args.size() != 1) return EXIT_USAGE;
    const std::string& code = inv.args[0];
    if (int rc = unlock(ctx, code); rc != EXIT_OK) return rc;

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (boost::algorithm::trim_copy(text).empty()) {
        ctx.log.append("[上传] 失败，当前文本框为空。");
        return EXIT_FAILURE_OP;
    }

    ctx.log.append("[上传] 正在上传文本内容...");
    transfer::Uploader uploader(*ctx.client, ctx.log.callback());
    return uploader.upload_text(ctx.server, code, text).success ? EXIT_OK : EXIT_FAILURE_OP;
}

int cmd_list(Context& ctx, const Invocation& inv, std::ostream& out) {
    if (inv.args.size() != 1) return EXIT_USAGE;
    const std::string& code = inv.args[0];
    if (int rc = unlock(ctx, code); rc != EXIT_OK) return rc;

    ctx.log.append("[下载] 正在查询可下载文件列表...");
    transfer::Downloader downloader(*ctx.client, ctx.log.callback());
    for (const auto& record : downloader.list_files(ctx.server, code)) {
        out << record.id << '\t' << record.file_name << '\n';
    }
    return EXIT_OK;
}

int cmd_download(Context& ctx, const Invocation& inv) {
    if (inv.args.size() < 3) return EXIT_USAGE;
    const std::string& code = inv.args[0];
    const std::string& dest = inv.args[1];
    if (int rc = unlock(ctx, code); rc != EXIT_OK) return rc;

    std::vector<std::string> ids(inv.args.begin() + 2, inv.args.end());
    auto records = lookup(ctx, code, ids);
    std::string name = transfer::download_name(records);

    // name never carries a directory part, so the file lands inside dest
    std::error_code ec;
    std::string target = dest;
    if (fs::is_directory(fs::u8path(dest), ec)) {
        target = (fs::u8path(dest) / fs::u8path(name).filename()).u8string();
    }

    transfer::Downloader downloader(*ctx.client, ctx.log.callback());
    return downloader.download(ctx.server, records, name, target) ? EXIT_OK : EXIT_FAILURE_OP;
}

int cmd_cat(Context& ctx, const Invocation& inv, std::ostream& out) {
    if (inv.args.size() != 2) return EXIT_USAGE;
    const std::string& code = inv.args[0];
    if (int rc = unlock(ctx, code); rc != EXIT_OK) return rc;

    auto records = lookup(ctx, code, {inv.args[1]});
    transfer::Downloader downloader(*ctx.client, ctx.log.callback());
    auto text = downloader.load_text(ctx.server, records.front());
    if (!text) return EXIT_FAILURE_OP;
    out << *text;
    return EXIT_OK;
}

} // namespace

bool parse_args(const std::vector<std::string>& argv, Invocation& out) {
    std::size_t i = 0;
    while (i < argv.size() && argv[i].rfind("--", 0) == 0) {
        if (argv[i] == "--config" && i + 1 < argv.size()) {
            out.config_path = argv[i + 1];
            i += 2;
        } else {
            return false;
        }
    }
    if (i < argv.size()) {
        out.command = argv[i++];
    }
    out.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i), argv.end());
    return true;
}

void print_usage(std::ostream& os) {
    os << "Usage: relaydrop [--config PATH] <command> [args]\n"
       << "\n"
       << "  (no command)                  launch the desktop client (GUI builds only)\n"
       << "  host <address>                validate and save the server address\n"
       << "  resolve <code>                check that a code is valid\n"
       << "  upload <code> <file>...       upload files, renaming on collision\n"
       << "  upload-text <code>            upload stdin as a text file\n"
       << "  list <code>                   list downloadable files (id<TAB>name)\n"
       << "  download <code> <dest> <id>...\n"
       << "                                download files; several ids arrive as one zip\n"
       << "  cat <code> <id>               print a remote text file\n";
}

int run(const Invocation& invocation, std::istream& in, std::ostream& out, std::ostream& err,
        std::shared_ptr<transport::HttpTransport> http) {
    Context ctx;
    ctx.log.add_sink([&err](const std::string& line, const std::string& /*message*/) {
        err << line << '\n';
    });

    std::string path = invocation.config_path.empty() ? config::default_config_path() : invocation.config_path;
    ctx.store = std::make_unique<config::ConfigStore>(path, ctx.log.callback());

    logging::ActivityLog& log = ctx.log;
    ctx.client = std::make_unique<transport::Client>(
        http ? std::move(http) : std::shared_ptr<transport::HttpTransport>(std::make_shared<transport::BeastTransport>()),
        [&log](const std::string& what, const std::string& url) {
            log.append("网络请求异常：" + what + " - " + url);
        });

    const std::string& cmd = invocation.command;
    int rc = EXIT_USAGE;
    if (cmd == "host") {
        rc = cmd_host(ctx, invocation);
    } else if (cmd == "resolve") {
        rc = cmd_resolve(ctx, invocation);
    } else if (cmd == "upload") {
        rc = cmd_upload(ctx, invocation);
    } else if (cmd == "upload-text") {
        rc = cmd_upload_text(ctx, invocation, in);
    } else if (cmd == "list") {
        rc = cmd_list(ctx, invocation, out);
    } else if (cmd == "download") {
        rc = cmd_download(ctx, invocation);
    } else if (cmd == "cat") {
        rc = cmd_cat(ctx, invocation, out);
    }

    if (rc == EXIT_USAGE) {
        print_usage(err);
    }
    return rc;
}

int run_main(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err,
             const GuiLauncher& launch_gui) {
    Invocation invocation;
    if (!parse_args(args, invocation)) {
        print_usage(err);
        return EXIT_USAGE;
    }

    if (invocation.command.empty()) {
        if (!launch_gui) {
            print_usage(err);
            return EXIT_USAGE;
        }
        return launch_gui(invocation.config_path.empty() ? config::default_config_path()
                                                         : invocation.config_path);
    }
    return run(invocation, in, out, err);
}

} // namespace cli
