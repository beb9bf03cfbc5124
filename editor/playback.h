// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

class QString;

// Asks the desktop to open the file with its default application.
void playFile(const QString& filePath);
