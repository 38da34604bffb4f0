#pragma once

#include <gtk/gtk.h>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include "activity_log.hpp"
#include "dispatch.hpp"
#include "relay_client.hpp"

namespace ui {

class UploadPanel;

class MainWindow {
public:
    MainWindow(GtkApplication* app, const std::string& config_path);
    ~MainWindow();

    GtkWidget* get_window() const { return window_; }

private:
    GtkWidget* window_;
    GtkWidget* header_bar_;
    GtkWidget* title_label_;
    GtkWidget* code_entry_;
    GtkWidget* unlock_button_;
    GtkWidget* confirm_button_;
    GtkWidget* download_button_;
    GtkWidget* host_button_;
    GtkWidget* text_view_;
    GtkWidget* log_view_;
    GtkWidget* status_label_;

    UploadPanel* upload_panel_;

    logging::ActivityLog log_;
    std::unique_ptr<app::RelayClient> client_;
    std::atomic<gint64> last_input_us_;

    void setup_css();
    GtkWidget* build_code_card();
    GtkWidget* build_text_area();
    GtkWidget* build_log_area();
    void install_idle_tracking();

    void apply_state(session::State state, const std::string& code);
    void set_upload_busy(bool busy);
    void show_host_dialog(app::HostPrompt reason);
    void show_download_dialog(const std::vector<protocol::RemoteFileRecord>& records);
    void set_text(const std::string& text);
    std::string get_text() const;
    std::optional<double> idle_seconds() const;

    static void on_unlock_clicked(GtkButton* button, gpointer user_data);
    static void on_confirm_clicked(GtkButton* button, gpointer user_data);
    static void on_download_clicked(GtkButton* button, gpointer user_data);
    static void on_host_clicked(GtkButton* button, gpointer user_data);
    static void on_code_activate(GtkEntry* entry, gpointer user_data);
    static void on_code_insert(GtkEditable* editable, const char* text, int length,
                               int* position, gpointer user_data);
    static gboolean on_close_request(GtkWindow* window, gpointer user_data);
    static void on_destroy(GtkWidget* widget, gpointer data);
};

// Runs tasks on the GTK main loop
dispatch::Dispatcher idle_dispatcher();

int run_gui(int argc, char* argv[], const std::string& config_path);

} // namespace ui
