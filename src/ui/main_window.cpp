#include "ui/main_window.hpp"
#include "ui/download_dialog.hpp"
#include "ui/host_dialog.hpp"
#include "ui/upload_panel.hpp"
#include <cctype>

namespace ui {

namespace {

constexpr const char* kWindowTitle = "税务云文件中转客户端";

const char* CSS_STYLE = R"(
window {
    background-color: #f4f6fa;
}

headerbar {
    background: linear-gradient(to right, #1f4e79, #2e75b6);
    color: #ffffff;
}

.title-text {
    font-size: 15px;
    font-weight: bold;
}

.card {
    background-color: #ffffff;
    border: 1px solid #d5dbe5;
    border-radius: 10px;
    padding: 12px;
    margin: 6px 8px;
}

.code-entry {
    font-family: monospace;
    font-size: 18px;
    letter-spacing: 4px;
}

.drop-zone {
    background-color: #eef3fb;
    border: 2px dashed #9bb4d6;
    border-radius: 12px;
    padding: 28px;
    margin: 6px 8px;
}

.drop-zone-active {
    border-color: #2e75b6;
    background-color: #dce8f7;
}

.drop-zone-locked {
    background-color: #f0f0f0;
    border-color: #c8c8c8;
    color: #8a8a8a;
}

.log-view text {
    background-color: #1e1e1e;
    color: #d4d4d4;
    font-family: monospace;
    font-size: 12px;
}

.status-text {
    color: #5a6270;
    font-size: 12px;
    padding: 4px 10px;
}

.hint-text {
    color: #808890;
    font-size: 12px;
}

.error-text {
    color: #c0392b;
}

button.suggested-action {
    border-radius: 8px;
    padding: 6px 16px;
    font-weight: bold;
}
)";

// ─── Idle callback data structs ─────────────────────────────────────────────

struct DispatchData {
    dispatch::Task task;
};

struct LogLineData {
    GtkWidget* log_view;
    GtkWidget* status_label;
    std::string line;
    std::string message;
};

// ─── Idle callbacks (run on main thread) ────────────────────────────────────

gboolean run_task_idle(gpointer data) {
    std::unique_ptr<DispatchData> d(static_cast<DispatchData*>(data));
    d->task();
    return G_SOURCE_REMOVE;
}

gboolean append_log_idle(gpointer data) {
    auto* d = static_cast<LogLineData*>(data);
    if (GTK_IS_TEXT_VIEW(d->log_view)) {
        GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(d->log_view));
        GtkTextIter end;
        gtk_text_buffer_get_end_iter(buffer, &end);
        std::string text = d->line + "\n";
        gtk_text_buffer_insert(buffer, &end, text.c_str(), -1);

        GtkTextMark* mark = gtk_text_buffer_get_insert(buffer);
        gtk_text_buffer_get_end_iter(buffer, &end);
        gtk_text_buffer_place_cursor(buffer, &end);
        gtk_text_view_scroll_mark_onscreen(GTK_TEXT_VIEW(d->log_view), mark);
    }
    if (GTK_IS_LABEL(d->status_label)) {
        gtk_label_set_text(GTK_LABEL(d->status_label), logging::status_text(d->message).c_str());
    }
    g_object_unref(d->log_view);
    g_object_unref(d->status_label);
    delete d;
    return G_SOURCE_REMOVE;
}

} // namespace

dispatch::Dispatcher idle_dispatcher() {
    return [](dispatch::Task task) {
        g_idle_add(run_task_idle, new DispatchData{std::move(task)});
    };
}

// ─── MainWindow ─────────────────────────────────────────────────────────────

void MainWindow::setup_css() {
    GtkCssProvider* provider = gtk_css_provider_new();
    gtk_css_provider_load_from_string(provider, CSS_STYLE);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(),
        GTK_STYLE_PROVIDER(provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
    g_object_unref(provider);
}

MainWindow::MainWindow(GtkApplication* app, const std::string& config_path)
    : last_input_us_(g_get_monotonic_time()) {
    setup_css();

    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), kWindowTitle);
    gtk_window_set_default_size(GTK_WINDOW(window_), 760, 680);

    header_bar_ = gtk_header_bar_new();
    gtk_window_set_titlebar(GTK_WINDOW(window_), header_bar_);

    title_label_ = gtk_label_new(kWindowTitle);
    gtk_widget_add_css_class(title_label_, "title-text");
    gtk_header_bar_set_title_widget(GTK_HEADER_BAR(header_bar_), title_label_);

    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 4);
    gtk_box_append(GTK_BOX(vbox), build_code_card());
    gtk_box_append(GTK_BOX(vbox), build_text_area());

    client_ = std::make_unique<app::RelayClient>(
        config_path, log_, idle_dispatcher(), app::ClientOptions{}, nullptr,
        [this] { return idle_seconds(); });

    upload_panel_ = new UploadPanel(GTK_WINDOW(window_), *client_);
    gtk_box_append(GTK_BOX(vbox), upload_panel_->get_widget());
    gtk_box_append(GTK_BOX(vbox), build_log_area());

    status_label_ = gtk_label_new("");
    gtk_label_set_xalign(GTK_LABEL(status_label_), 0.0);
    gtk_label_set_ellipsize(GTK_LABEL(status_label_), PANGO_ELLIPSIZE_END);
    gtk_widget_add_css_class(status_label_, "status-text");
    gtk_box_append(GTK_BOX(vbox), status_label_);

    gtk_window_set_child(GTK_WINDOW(window_), vbox);

    // Log lines may come from any thread
    GtkWidget* log_view = log_view_;
    GtkWidget* status_label = status_label_;
    log_.add_sink([log_view, status_label](const std::string& line, const std::string& message) {
        g_idle_add(append_log_idle, new LogLineData{
            GTK_WIDGET(g_object_ref(log_view)), GTK_WIDGET(g_object_ref(status_label)), line, message
        });
    });
    log_.add_sink(logging::stderr_sink());

    app::ClientHooks hooks;
    hooks.on_session_state = [this](session::State state, const std::string& code) { apply_state(state, code); };
    hooks.on_code_rejected = [this] { gtk_editable_set_text(GTK_EDITABLE(code_entry_), ""); };
    hooks.on_upload_busy = [this](bool busy) { set_upload_busy(busy); };
    hooks.on_host_required = [this](app::HostPrompt reason) { show_host_dialog(reason); };
    client_->set_hooks(std::move(hooks));

    install_idle_tracking();
    g_signal_connect(window_, "close-request", G_CALLBACK(on_close_request), this);
    g_signal_connect(window_, "destroy", G_CALLBACK(on_destroy), this);

    apply_state(session::State::LOCKED, "");
    gtk_window_present(GTK_WINDOW(window_));

    log_.append("[启动] 界面加载完成，如首次使用请先点击“配置地址”设置 HOST，然后输入验证码并点击“确定”。");
    config::Settings saved = client_->config().load_all();
    if (session::Session::is_valid_code(saved.code)) {
        gtk_editable_set_text(GTK_EDITABLE(code_entry_), saved.code.c_str());
    }
    client_->start();
}

MainWindow::~MainWindow() {
    client_->close();
    client_.reset();
    delete upload_panel_;
}

GtkWidget* MainWindow::build_code_card() {
    GtkWidget* card = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_add_css_class(card, "card");

    GtkWidget* label = gtk_label_new("验证码：");
    gtk_box_append(GTK_BOX(card), label);

    code_entry_ = gtk_entry_new();
    gtk_entry_set_max_length(GTK_ENTRY(code_entry_), 6);
    gtk_entry_set_input_purpose(GTK_ENTRY(code_entry_), GTK_INPUT_PURPOSE_DIGITS);
    gtk_editable_set_width_chars(GTK_EDITABLE(code_entry_), 8);
    gtk_widget_add_css_class(code_entry_, "code-entry");
    g_signal_connect(gtk_editable_get_delegate(GTK_EDITABLE(code_entry_)), "insert-text",
                     G_CALLBACK(on_code_insert), this);
    g_signal_connect(code_entry_, "activate", G_CALLBACK(on_code_activate), this);
    gtk_box_append(GTK_BOX(card), code_entry_);

    unlock_button_ = gtk_button_new_with_label("确定");
    gtk_widget_add_css_class(unlock_button_, "suggested-action");
    g_signal_connect(unlock_button_, "clicked", G_CALLBACK(on_unlock_clicked), this);
    gtk_box_append(GTK_BOX(card), unlock_button_);

    GtkWidget* spacer = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
    gtk_widget_set_hexpand(spacer, TRUE);
    gtk_box_append(GTK_BOX(card), spacer);

    confirm_button_ = gtk_button_new_with_label("上传文本");
    g_signal_connect(confirm_button_, "clicked", G_CALLBACK(on_confirm_clicked), this);
    gtk_box_append(GTK_BOX(card), confirm_button_);

    download_button_ = gtk_button_new_with_label("下载文件");
    g_signal_connect(download_button_, "clicked", G_CALLBACK(on_download_clicked), this);
    gtk_box_append(GTK_BOX(card), download_button_);

    host_button_ = gtk_button_new_with_label("配置地址");
    gtk_widget_add_css_class(host_button_, "flat");
    g_signal_connect(host_button_, "clicked", G_CALLBACK(on_host_clicked), this);
    gtk_box_append(GTK_BOX(card), host_button_);

    return card;
}

GtkWidget* MainWindow::build_text_area() {
    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 200);
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_widget_add_css_class(scroll, "card");

    text_view_ = gtk_text_view_new();
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(text_view_), GTK_WRAP_WORD_CHAR);
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), text_view_);
    return scroll;
}

GtkWidget* MainWindow::build_log_area() {
    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroll), 140);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll),
                                   GTK_POLICY_AUTOMATIC, GTK_POLICY_AUTOMATIC);

    log_view_ = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(log_view_), FALSE);
    gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(log_view_), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(log_view_), TRUE);
    gtk_widget_add_css_class(log_view_, "log-view");
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), log_view_);
    return scroll;
}

// Any key, pointer motion or click counts as activity
void MainWindow::install_idle_tracking() {
    auto touch = +[](gpointer data) {
        auto* self = static_cast<MainWindow*>(data);
        self->last_input_us_.store(g_get_monotonic_time());
    };

    GtkEventController* keys = gtk_event_controller_key_new();
    gtk_event_controller_set_propagation_phase(keys, GTK_PHASE_CAPTURE);
    g_signal_connect_swapped(keys, "key-pressed",
        G_CALLBACK(+[](gpointer data) -> gboolean {
            static_cast<MainWindow*>(data)->last_input_us_.store(g_get_monotonic_time());
            return FALSE;
        }), this);
    gtk_widget_add_controller(window_, keys);

    GtkEventController* motion = gtk_event_controller_motion_new();
    gtk_event_controller_set_propagation_phase(motion, GTK_PHASE_CAPTURE);
    g_signal_connect_swapped(motion, "motion", G_CALLBACK(touch), this);
    gtk_widget_add_controller(window_, motion);

    GtkGesture* click = gtk_gesture_click_new();
    gtk_gesture_single_set_button(GTK_GESTURE_SINGLE(click), 0);
    gtk_event_controller_set_propagation_phase(GTK_EVENT_CONTROLLER(click), GTK_PHASE_CAPTURE);
    g_signal_connect_swapped(click, "pressed", G_CALLBACK(touch), this);
    gtk_widget_add_controller(window_, GTK_EVENT_CONTROLLER(click));
}

std::optional<double> MainWindow::idle_seconds() const {
    gint64 elapsed = g_get_monotonic_time() - last_input_us_.load();
    return static_cast<double>(elapsed) / G_USEC_PER_SEC;
}

void MainWindow::apply_state(session::State state, const std::string& code) {
    bool unlocked = state == session::State::UNLOCKED;

    gtk_widget_set_sensitive(code_entry_, state == session::State::LOCKED);
    gtk_button_set_label(GTK_BUTTON(unlock_button_), unlocked ? "重置" : "确定");
    gtk_widget_set_sensitive(unlock_button_, state != session::State::POLLING);
    gtk_text_view_set_editable(GTK_TEXT_VIEW(text_view_), unlocked);

    bool busy = client_ && client_->upload_busy();
    gtk_widget_set_sensitive(confirm_button_, unlocked && !busy);
    gtk_widget_set_sensitive(download_button_, unlocked && !busy);
    upload_panel_->set_locked(!unlocked);

    std::string title = kWindowTitle;
    if (unlocked && !code.empty()) {
        title += " — 验证码: " + code + "（已启用）";
    }
    gtk_window_set_title(GTK_WINDOW(window_), title.c_str());
    gtk_label_set_text(GTK_LABEL(title_label_), title.c_str());
}

void MainWindow::set_upload_busy(bool busy) {
    bool unlocked = client_->unlocked();
    gtk_widget_set_sensitive(confirm_button_, unlocked && !busy);
    gtk_widget_set_sensitive(download_button_, unlocked && !busy);
}

void MainWindow::show_host_dialog(app::HostPrompt reason) {
    auto* dialog = new HostDialog(GTK_WINDOW(window_), *client_, reason);
    dialog->show();
}

void MainWindow::show_download_dialog(const std::vector<protocol::RemoteFileRecord>& records) {
    auto* dialog = new DownloadDialog(GTK_WINDOW(window_), *client_, records,
                                      [this](const std::string& text) { set_text(text); });
    dialog->show();
}

void MainWindow::set_text(const std::string& text) {
    GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(text_view_));
    gtk_text_buffer_set_text(buffer, text.c_str(), static_cast<int>(text.size()));
}

std::string MainWindow::get_text() const {
    GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(text_view_));
    GtkTextIter start, end;
    gtk_text_buffer_get_bounds(buffer, &start, &end);
    char* raw = gtk_text_buffer_get_text(buffer, &start, &end, FALSE);
    std::string text = raw ? raw : "";
    g_free(raw);
    return text;
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void MainWindow::on_unlock_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    if (self->client_->unlocked()) {
        self->client_->reset_session();
        return;
    }
    std::string code = gtk_editable_get_text(GTK_EDITABLE(self->code_entry_));
    self->client_->submit_code(code);
}

void MainWindow::on_code_activate(GtkEntry* /*entry*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    if (self->client_->state() == session::State::LOCKED) {
        on_unlock_clicked(nullptr, user_data);
    }
}

void MainWindow::on_code_insert(GtkEditable* editable, const char* text, int length,
                                int* /*position*/, gpointer /*user_data*/) {
    std::size_t n = length < 0 ? std::char_traits<char>::length(text) : static_cast<std::size_t>(length);
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            g_signal_stop_emission_by_name(editable, "insert-text");
            return;
        }
    }
}

void MainWindow::on_confirm_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->client_->upload_text(self->get_text());
}

void MainWindow::on_download_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->client_->list_remote_files([self](const std::vector<protocol::RemoteFileRecord>& records) {
        self->show_download_dialog(records);
    });
}

void MainWindow::on_host_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->show_host_dialog(app::HostPrompt::MANUAL);
}

gboolean MainWindow::on_close_request(GtkWindow* /*window*/, gpointer user_data) {
    auto* self = static_cast<MainWindow*>(user_data);
    self->client_->close();
    return FALSE;
}

void MainWindow::on_destroy(GtkWidget* /*widget*/, gpointer data) {
    delete static_cast<MainWindow*>(data);
}

static void activate_callback(GtkApplication* app, gpointer user_data) {
    // Deleted when its window is destroyed
    new MainWindow(app, *static_cast<std::string*>(user_data));
}

int run_gui(int /*argc*/, char* /*argv*/[], const std::string& config_path) {
    std::string path = config_path;
    GtkApplication* app = gtk_application_new("dev.relaydrop.app", G_APPLICATION_DEFAULT_FLAGS);
    g_signal_connect(app, "activate", G_CALLBACK(activate_callback), &path);
    int status = g_application_run(G_APPLICATION(app), 0, nullptr);
    g_object_unref(app);
    return status;
}

} // namespace ui
