#include "ui/download_dialog.hpp"
#include <memory>
#include <optional>
#include <string>
#include "transfer.hpp"

namespace ui {

namespace {

struct SaveRequest {
    app::RelayClient* client;
    std::vector<protocol::RemoteFileRecord> records;
    std::string display_name;
};

void on_save_response(GtkNativeDialog* dialog, int response, gpointer data) {
    std::unique_ptr<SaveRequest> request(static_cast<SaveRequest*>(data));

    std::optional<std::string> dest;
G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    if (response == GTK_RESPONSE_ACCEPT) {
        GFile* file = gtk_file_chooser_get_file(GTK_FILE_CHOOSER(dialog));
        if (file) {
            char* path = g_file_get_path(file);
            if (path) {
                dest = path;
                g_free(path);
            }
            g_object_unref(file);
        }
    }
G_GNUC_END_IGNORE_DEPRECATIONS
    g_object_unref(dialog);

    request->client->download_selected(request->records, request->display_name, dest);
}

} // namespace

DownloadDialog::DownloadDialog(GtkWindow* parent, app::RelayClient& client,
                               std::vector<protocol::RemoteFileRecord> records, app::TextCallback on_text)
    : parent_window_(parent), client_(client), records_(std::move(records)), on_text_(std::move(on_text)) {
    dialog_ = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(dialog_), "选择要下载的文件");
    gtk_window_set_default_size(GTK_WINDOW(dialog_), 560, 420);
    gtk_window_set_modal(GTK_WINDOW(dialog_), TRUE);
    if (parent) {
        gtk_window_set_transient_for(GTK_WINDOW(dialog_), parent);
    }

    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(vbox, 10);
    gtk_widget_set_margin_end(vbox, 10);
    gtk_widget_set_margin_top(vbox, 10);
    gtk_widget_set_margin_bottom(vbox, 10);

    GtkWidget* prompt = gtk_label_new("请选择要下载的文件（可按 Ctrl/Shift 多选）：");
    gtk_label_set_xalign(GTK_LABEL(prompt), 0.0);
    gtk_box_append(GTK_BOX(vbox), prompt);

    GtkWidget* scroll = gtk_scrolled_window_new();
    gtk_widget_set_vexpand(scroll, TRUE);
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroll), GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);

    list_box_ = gtk_list_box_new();
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(list_box_), GTK_SELECTION_MULTIPLE);
    for (const auto& record : records_) {
        GtkWidget* label = gtk_label_new(record.file_name.c_str());
        gtk_label_set_xalign(GTK_LABEL(label), 0.0);
        gtk_label_set_ellipsize(GTK_LABEL(label), PANGO_ELLIPSIZE_MIDDLE);
        gtk_list_box_append(GTK_LIST_BOX(list_box_), label);
    }
    g_signal_connect(list_box_, "selected-rows-changed", G_CALLBACK(on_selection_changed), this);
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroll), list_box_);
    gtk_box_append(GTK_BOX(vbox), scroll);

    GtkWidget* hbox = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 10);

    GtkWidget* download_btn = gtk_button_new_with_label("下载选中文件");
    gtk_widget_add_css_class(download_btn, "suggested-action");
    g_signal_connect(download_btn, "clicked", G_CALLBACK(on_download_clicked), this);
    gtk_box_append(GTK_BOX(hbox), download_btn);

    load_button_ = gtk_button_new_with_label("加载到文本框");
    gtk_widget_set_sensitive(load_button_, FALSE);
    g_signal_connect(load_button_, "clicked", G_CALLBACK(on_load_clicked), this);
    gtk_box_append(GTK_BOX(hbox), load_button_);

    GtkWidget* spacer = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
    gtk_widget_set_hexpand(spacer, TRUE);
    gtk_box_append(GTK_BOX(hbox), spacer);

    GtkWidget* close_btn = gtk_button_new_with_label("关闭");
    g_signal_connect(close_btn, "clicked", G_CALLBACK(on_close_clicked), this);
    gtk_box_append(GTK_BOX(hbox), close_btn);

    gtk_box_append(GTK_BOX(vbox), hbox);
    gtk_window_set_child(GTK_WINDOW(dialog_), vbox);

    g_signal_connect(dialog_, "destroy", G_CALLBACK(on_destroy), this);
}

void DownloadDialog::show() {
    gtk_window_present(GTK_WINDOW(dialog_));
}

std::vector<protocol::RemoteFileRecord> DownloadDialog::selected() const {
    std::vector<protocol::RemoteFileRecord> result;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        GtkListBoxRow* row = gtk_list_box_get_row_at_index(GTK_LIST_BOX(list_box_), static_cast<int>(i));
        if (row && gtk_list_box_row_is_selected(row)) {
            result.push_back(records_[i]);
        }
    }
    return result;
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void DownloadDialog::on_selection_changed(GtkListBox* /*list_box*/, gpointer user_data) {
    auto* self = static_cast<DownloadDialog*>(user_data);
    auto chosen = self->selected();
    bool loadable = chosen.size() == 1 && transfer::is_text_file(chosen.front().file_name);
    gtk_widget_set_sensitive(self->load_button_, loadable);
}

void DownloadDialog::on_download_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<DownloadDialog*>(user_data);
    auto chosen = self->selected();
    if (chosen.empty()) {
        self->client_.download_selected(chosen, "", std::nullopt);  // logs the hint
        return;
    }

    std::string name = transfer::download_name(chosen);
    auto* request = new SaveRequest{&self->client_, chosen, name};

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* native = gtk_file_chooser_native_new(
        "选择文件保存位置", self->parent_window_,
        GTK_FILE_CHOOSER_ACTION_SAVE, "_保存", "_取消");
    gtk_native_dialog_set_modal(GTK_NATIVE_DIALOG(native), TRUE);
    gtk_file_chooser_set_current_name(GTK_FILE_CHOOSER(native), name.c_str());
    g_signal_connect(native, "response", G_CALLBACK(on_save_response), request);
    gtk_native_dialog_show(GTK_NATIVE_DIALOG(native));
G_GNUC_END_IGNORE_DEPRECATIONS

    gtk_window_destroy(GTK_WINDOW(self->dialog_));
}

void DownloadDialog::on_load_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<DownloadDialog*>(user_data);
    auto chosen = self->selected();
    if (chosen.size() != 1) return;

    self->client_.load_selected_to_buffer(chosen.front(), self->on_text_);
    gtk_window_destroy(GTK_WINDOW(self->dialog_));
}

void DownloadDialog::on_close_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<DownloadDialog*>(user_data);
    gtk_window_destroy(GTK_WINDOW(self->dialog_));
}

void DownloadDialog::on_destroy(GtkWidget* /*widget*/, gpointer user_data) {
    delete static_cast<DownloadDialog*>(user_data);
}

} // namespace ui
