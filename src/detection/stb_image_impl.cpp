// stb_image 実装はこの翻訳単位でのみ展開する
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
