#pragma once

#include <gtk/gtk.h>
#include <vector>
#include "protocol/remote_file.hpp"
#include "relay_client.hpp"

namespace ui {

// Remote file picker: download the selection or load one text file into the
// main buffer. Deletes itself when closed.
class DownloadDialog {
public:
    DownloadDialog(GtkWindow* parent, app::RelayClient& client,
                   std::vector<protocol::RemoteFileRecord> records, app::TextCallback on_text);

    void show();

private:
    GtkWidget* dialog_;
    GtkWidget* list_box_;
    GtkWidget* load_button_;
    GtkWindow* parent_window_;
    app::RelayClient& client_;
    std::vector<protocol::RemoteFileRecord> records_;
    app::TextCallback on_text_;

    std::vector<protocol::RemoteFileRecord> selected() const;

    static void on_selection_changed(GtkListBox* list_box, gpointer user_data);
    static void on_download_clicked(GtkButton* button, gpointer user_data);
    static void on_load_clicked(GtkButton* button, gpointer user_data);
    static void on_close_clicked(GtkButton* button, gpointer user_data);
    static void on_destroy(GtkWidget* widget, gpointer user_data);
};

} // namespace ui
