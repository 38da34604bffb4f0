#include "ui/upload_panel.hpp"

namespace ui {

UploadPanel::UploadPanel(GtkWindow* parent_window, app::RelayClient& client)
    : parent_window_(parent_window), client_(client) {

    panel_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);

    // ─── Drop zone ──────────────────────────────────────────────────────
    drop_area_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_add_css_class(drop_area_, "drop-zone");

    drop_label_ = gtk_label_new("");
    gtk_box_append(GTK_BOX(drop_area_), drop_label_);

    choose_file_button_ = gtk_button_new_with_label("选择文件上传");
    gtk_widget_set_halign(choose_file_button_, GTK_ALIGN_CENTER);
    g_signal_connect(choose_file_button_, "clicked", G_CALLBACK(on_choose_file), this);
    gtk_box_append(GTK_BOX(drop_area_), choose_file_button_);

    gtk_box_append(GTK_BOX(panel_), drop_area_);

    // ─── Drag & drop target ─────────────────────────────────────────────
    GtkDropTarget* drop_target = gtk_drop_target_new(GDK_TYPE_FILE_LIST, GDK_ACTION_COPY);
    g_signal_connect(drop_target, "drop", G_CALLBACK(on_drop), this);
    g_signal_connect(drop_target, "enter", G_CALLBACK(on_drag_enter), this);
    g_signal_connect(drop_target, "leave", G_CALLBACK(on_drag_leave), this);
    gtk_widget_add_controller(drop_area_, GTK_EVENT_CONTROLLER(drop_target));

    set_locked(true);
}

void UploadPanel::set_locked(bool locked) {
    if (locked) {
        gtk_label_set_text(GTK_LABEL(drop_label_), "请先验证验证码以启用拖拽功能");
        gtk_widget_add_css_class(drop_area_, "drop-zone-locked");
    } else {
        gtk_label_set_text(GTK_LABEL(drop_label_), "将文件拖拽到此处（支持多个）");
        gtk_widget_remove_css_class(drop_area_, "drop-zone-locked");
    }
    gtk_widget_set_sensitive(choose_file_button_, !locked);
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void UploadPanel::on_choose_file(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<UploadPanel*>(user_data);

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* native = gtk_file_chooser_native_new(
        "选择要上传的文件", self->parent_window_,
        GTK_FILE_CHOOSER_ACTION_OPEN, "_打开", "_取消");
    gtk_native_dialog_set_modal(GTK_NATIVE_DIALOG(native), TRUE);
    gtk_file_chooser_set_select_multiple(GTK_FILE_CHOOSER(native), TRUE);

    g_signal_connect(native, "response", G_CALLBACK(+[](GtkNativeDialog* dialog, int response, gpointer data) {
        if (response == GTK_RESPONSE_ACCEPT) {
            auto* panel = static_cast<UploadPanel*>(data);
            std::vector<std::string> paths;
            GListModel* files = gtk_file_chooser_get_files(GTK_FILE_CHOOSER(dialog));
            for (guint i = 0; i < g_list_model_get_n_items(files); i++) {
                GFile* file = G_FILE(g_list_model_get_item(files, i));
                char* path = g_file_get_path(file);
                if (path) {
                    paths.emplace_back(path);
                    g_free(path);
                }
                g_object_unref(file);
            }
            g_object_unref(files);
            panel->client_.upload_files(paths);
        }
        g_object_unref(dialog);
    }), self);

    gtk_native_dialog_show(GTK_NATIVE_DIALOG(native));
G_GNUC_END_IGNORE_DEPRECATIONS
}

gboolean UploadPanel::on_drop(GtkDropTarget* /*target*/, const GValue* value,
                              double /*x*/, double /*y*/, gpointer user_data) {
    auto* self = static_cast<UploadPanel*>(user_data);
    gtk_widget_remove_css_class(self->drop_area_, "drop-zone-active");

    if (!G_VALUE_HOLDS(value, GDK_TYPE_FILE_LIST)) return FALSE;

    std::vector<std::string> paths;
    GdkFileList* file_list = static_cast<GdkFileList*>(g_value_get_boxed(value));
    GSList* files = gdk_file_list_get_files(file_list);
    for (GSList* l = files; l != nullptr; l = l->next) {
        char* path = g_file_get_path(G_FILE(l->data));
        if (path) {
            paths.emplace_back(path);
            g_free(path);
        }
    }
    g_slist_free(files);

    // Locked and unconfigured states are reported by the client
    self->client_.drop_files(paths);
    return TRUE;
}

GdkDragAction UploadPanel::on_drag_enter(GtkDropTarget* /*target*/, double /*x*/, double /*y*/,
                                         gpointer user_data) {
    auto* self = static_cast<UploadPanel*>(user_data);
    gtk_widget_add_css_class(self->drop_area_, "drop-zone-active");
    return GDK_ACTION_COPY;
}

void UploadPanel::on_drag_leave(GtkDropTarget* /*target*/, gpointer user_data) {
    auto* self = static_cast<UploadPanel*>(user_data);
    gtk_widget_remove_css_class(self->drop_area_, "drop-zone-active");
}

} // namespace ui
