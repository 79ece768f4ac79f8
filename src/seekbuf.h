/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The seekbuf project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include "seekable_buffer.h"
#include "errors.h"
#include "buffer_config.h"
#include "seek_buffer.h"
#include "concurrent_seek_buffer.h"
#include "random_buffer.h"
#include "decorators/transaction_decorator.h"
#include "decorators/filesync_decorator.h"
#include "decorators/logging_decorator.h"
#include "persistence/buffer_files.h"
