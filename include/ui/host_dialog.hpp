#pragma once

#include <gtk/gtk.h>
#include "relay_client.hpp"

namespace ui {

// Modal editor for the server address. Deletes itself when closed.
class HostDialog {
public:
    HostDialog(GtkWindow* parent, app::RelayClient& client, app::HostPrompt reason);

    void show();

private:
    GtkWidget* dialog_;
    GtkWidget* entry_;
    GtkWidget* error_label_;
    app::RelayClient& client_;

    static void on_save_clicked(GtkButton* button, gpointer user_data);
    static void on_cancel_clicked(GtkButton* button, gpointer user_data);
    static void on_destroy(GtkWidget* widget, gpointer user_data);
};

} // namespace ui
