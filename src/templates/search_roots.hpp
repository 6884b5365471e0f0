#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Jupyter data directories, highest priority first, each suffixed with
// `subdirs`: $JUPYTER_PATH entries, the user data dir, the install prefix,
// then system-wide locations. Duplicates keep their first position.
std::vector<fs::path> jupyter_path(const std::vector<std::string>& subdirs = {});

// User data dir: $JUPYTER_DATA_DIR, else $XDG_DATA_HOME/jupyter,
// else ~/.local/share/jupyter (~/Library/Jupyter on macOS).
fs::path jupyter_data_dir();

// <source tree>/share/jupyter/folio, used ahead of installed copies.
fs::path development_data_dir();

// Candidate roots for template packages: extra_dirs, the development tree
// (only if it exists), then jupyter_path("folio", "template").
std::vector<fs::path> template_search_roots(const std::vector<fs::path>& extra_dirs = {});

// Static files served when no template provides them: the development
// tree's copy if present, else the installed one.
fs::path builtin_static_dir();
