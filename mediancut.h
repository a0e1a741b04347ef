#pragma once

#include <vector>
#include "pam.h"

/* at most newcolors entries; fewer when the histogram runs out of distinct colors */
std::vector<colormap_item> mediancut(std::vector<hist_item>& hist, unsigned int newcolors);
