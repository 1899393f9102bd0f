/*
 * Copyright (C) Andrey Pikas
 */

#pragma once

#define SEGALLOC_IMPEXP __attribute__((visibility("default")))
