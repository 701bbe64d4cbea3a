#pragma once

#include "slideshow/composer/v1/playlist.pb.h"
#include "slideshow/composer/v1/types.pb.h"
