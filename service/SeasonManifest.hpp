// Season manifest: one locator per line, grouped by "# series:" and
// "# season:" header lines. An optional title follows the locator after '|'.
//
//   # series: Some Show
//   # season: Season 1
//   channel/1001 | Pilot
//   channel/1002
#pragma once
#include <QString>
#include <string>
#include <vector>
#include "mediarelay/TransferTypes.hpp"

// Bulk tasks, in file order. Blank lines and other '#' lines are skipped.
bool parseSeasonManifest(const QString &text,
                         std::vector<mediarelay::TransferTask> &out,
                         std::string &err);
bool loadSeasonManifest(const QString &path,
                        std::vector<mediarelay::TransferTask> &out,
                        std::string &err);
