// =============================================================================
// Owns the stb implementation macros to avoid duplicate definitions.
// =============================================================================
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
