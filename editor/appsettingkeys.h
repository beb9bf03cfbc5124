// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

constexpr const char* EXTRACTOR_PROGRAM_KEY = "extractor.program";
constexpr const char* EXTRACTOR_PROGRAM_DEFAULT = "ffmpeg";
