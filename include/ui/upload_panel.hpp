#pragma once

#include <gtk/gtk.h>
#include <string>
#include <vector>
#include "relay_client.hpp"

namespace ui {

// Drop zone plus a file chooser fallback; both queue uploads on the client
class UploadPanel {
public:
    UploadPanel(GtkWindow* parent_window, app::RelayClient& client);

    GtkWidget* get_widget() const { return panel_; }
    void set_locked(bool locked);

private:
    GtkWidget* panel_;
    GtkWidget* drop_area_;
    GtkWidget* drop_label_;
    GtkWidget* choose_file_button_;
    GtkWindow* parent_window_;
    app::RelayClient& client_;

    static void on_choose_file(GtkButton* button, gpointer user_data);
    static gboolean on_drop(GtkDropTarget* target, const GValue* value,
                            double x, double y, gpointer user_data);
    static GdkDragAction on_drag_enter(GtkDropTarget* target, double x, double y, gpointer user_data);
    static void on_drag_leave(GtkDropTarget* target, gpointer user_data);
};

} // namespace ui
