/* This file is part of PinForge.
 *
 * PinForge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PinForge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PinForge.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once

// logging
#define OPTION_LOG                  "log"

// fonts
#define OPTION_FONTPATH             "fontPath"
#define OPTION_SYSTEMFONTPATHS      "systemFontPaths"
#define OPTION_DEFAULTFONT          "defaultFont"

// rendering
#define OPTION_ENHANCEIMAGE         "enhanceImage"
#define OPTION_THREADPOOLSIZE       "threadPoolSize"
#define OPTION_OUTPUTDIRECTORY      "outputDirectory"

// image fetch
#define OPTION_FETCHTIMEOUT         "fetch.timeoutSeconds"
#define OPTION_FETCHMAXBYTES        "fetch.maxBytes"
#define OPTION_FETCHUSERAGENT       "fetch.userAgent"
