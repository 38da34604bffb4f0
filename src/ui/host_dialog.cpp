#include "ui/host_dialog.hpp"

namespace ui {

namespace {

const char* tip_for(app::HostPrompt reason) {
    switch (reason) {
    case app::HostPrompt::STARTUP:
        return "未检测到配置文件或其中未配置服务器地址(HOST)。\n请先配置服务器地址后再使用客户端功能。";
    case app::HostPrompt::RUNTIME:
        return "当前尚未配置服务器地址(HOST)，或配置无效。\n请先完成以下配置。";
    case app::HostPrompt::MANUAL:
        break;
    }
    return "当前已配置服务器地址(HOST)。\n如需修改完成以下配置。";
}

} // namespace

HostDialog::HostDialog(GtkWindow* parent, app::RelayClient& client, app::HostPrompt reason)
    : client_(client) {
    dialog_ = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(dialog_), "配置服务器地址 (HOST)");
    gtk_window_set_default_size(GTK_WINDOW(dialog_), 420, 220);
    gtk_window_set_modal(GTK_WINDOW(dialog_), TRUE);
    if (parent) {
        gtk_window_set_transient_for(GTK_WINDOW(dialog_), parent);
    }

    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(vbox, 16);
    gtk_widget_set_margin_end(vbox, 16);
    gtk_widget_set_margin_top(vbox, 16);
    gtk_widget_set_margin_bottom(vbox, 16);

    GtkWidget* tip = gtk_label_new(tip_for(reason));
    gtk_label_set_xalign(GTK_LABEL(tip), 0.0);
    gtk_box_append(GTK_BOX(vbox), tip);

    GtkWidget* label = gtk_label_new("服务器地址（HOST）：");
    gtk_label_set_xalign(GTK_LABEL(label), 0.0);
    gtk_box_append(GTK_BOX(vbox), label);

    entry_ = gtk_entry_new();
    if (client_.host_configured()) {
        gtk_editable_set_text(GTK_EDITABLE(entry_), client_.server().authority().c_str());
    }
    gtk_box_append(GTK_BOX(vbox), entry_);

    GtkWidget* example = gtk_label_new("示例：192.168.1.1 或 example.com");
    gtk_label_set_xalign(GTK_LABEL(example), 0.0);
    gtk_widget_add_css_class(example, "hint-text");
    gtk_box_append(GTK_BOX(vbox), example);

    error_label_ = gtk_label_new("");
    gtk_label_set_xalign(GTK_LABEL(error_label_), 0.0);
    gtk_widget_add_css_class(error_label_, "error-text");
    gtk_box_append(GTK_BOX(vbox), error_label_);

    GtkWidget* hbox = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    GtkWidget* save_btn = gtk_button_new_with_label("保存");
    gtk_widget_add_css_class(save_btn, "suggested-action");
    g_signal_connect(save_btn, "clicked", G_CALLBACK(on_save_clicked), this);
    gtk_box_append(GTK_BOX(hbox), save_btn);

    GtkWidget* spacer = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
    gtk_widget_set_hexpand(spacer, TRUE);
    gtk_box_append(GTK_BOX(hbox), spacer);

    GtkWidget* cancel_btn = gtk_button_new_with_label("取消");
    g_signal_connect(cancel_btn, "clicked", G_CALLBACK(on_cancel_clicked), this);
    gtk_box_append(GTK_BOX(hbox), cancel_btn);
    gtk_box_append(GTK_BOX(vbox), hbox);

    g_signal_connect(entry_, "activate", G_CALLBACK(+[](GtkEntry*, gpointer data) {
        on_save_clicked(nullptr, data);
    }), this);
    g_signal_connect(dialog_, "destroy", G_CALLBACK(on_destroy), this);

    gtk_window_set_child(GTK_WINDOW(dialog_), vbox);
}

void HostDialog::show() {
    gtk_window_present(GTK_WINDOW(dialog_));
}

void HostDialog::on_save_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<HostDialog*>(user_data);
    app::Status status = self->client_.reconfigure_host(gtk_editable_get_text(GTK_EDITABLE(self->entry_)));
    if (!status.ok) {
        gtk_label_set_text(GTK_LABEL(self->error_label_), status.message.c_str());
        return;
    }
    gtk_window_destroy(GTK_WINDOW(self->dialog_));
}

void HostDialog::on_cancel_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<HostDialog*>(user_data);
    gtk_window_destroy(GTK_WINDOW(self->dialog_));
}

void HostDialog::on_destroy(GtkWidget* /*widget*/, gpointer user_data) {
    auto* self = static_cast<HostDialog*>(user_data);
    if (!self->client_.host_configured()) {
        self->client_.log().append("[配置] 未完成服务器地址配置，客户端功能暂不可用。");
    }
    delete self;
}

} // namespace ui
