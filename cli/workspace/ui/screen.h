#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sqlterm {
class ModalEditor;
class ResultGridModel;
}  // namespace sqlterm

namespace sqlterm::cli {

class Workspace;

/// Rendering switches for the workspace panes.
struct ScreenStyle {
  bool color = true;
  bool highlight = true;
};

/// Renders the editor pane body: one entry per visible line, each exactly width columns.
/// MUST keep the cursor row visible and MUST mark the cursor and selection when focused.
std::vector<std::string> render_editor_pane(const ModalEditor& editor,
                                            size_t width,
                                            size_t height,
                                            bool focused,
                                            const ScreenStyle& style);

/// Renders the grid pane: header line, separator, then rows of the current page.
/// MUST keep the selected row visible and MUST start with the row-number column.
std::vector<std::string> render_grid_pane(const ResultGridModel& grid,
                                          size_t width,
                                          size_t height,
                                          bool focused,
                                          const ScreenStyle& style);

/// Builds a complete frame (cursor positioning included) for a terminal of rows x cols.
std::string render_screen(const Workspace& workspace, int rows, int cols, const ScreenStyle& style);

}  // namespace sqlterm::cli
