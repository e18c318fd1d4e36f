/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file schema.hpp
 * @brief DDL for the supervisor's SQLite store.
 *
 * commands      : one row per persisted command definition
 * command_args  : ordered argv, idx defines replay order
 * command_env   : ordered environment, same convention
 * groups_log    : append-only lifecycle event log
 */

#ifndef PGS_SCHEMA_HPP_
#define PGS_SCHEMA_HPP_

namespace pgs {
namespace schema {

constexpr const char* kCreateTables = R"sql(
CREATE TABLE IF NOT EXISTS commands (
	command_id		TEXT		PRIMARY KEY,
	group_name		TEXT		NOT NULL,
	path			TEXT		NOT NULL DEFAULT ''
);

CREATE INDEX IF NOT EXISTS group_name_idx ON commands (group_name, command_id);

CREATE TABLE IF NOT EXISTS command_args (
	command_id		TEXT		NOT NULL,
	idx			INTEGER		NOT NULL,
	arg			TEXT		NOT NULL
);

CREATE INDEX IF NOT EXISTS command_args_idx ON command_args (command_id, idx);

CREATE TABLE IF NOT EXISTS command_env (
	command_id		TEXT		NOT NULL,
	idx			INTEGER		NOT NULL,
	env_var			TEXT		NOT NULL
);

CREATE INDEX IF NOT EXISTS command_env_idx ON command_env (command_id, idx);

CREATE TABLE IF NOT EXISTS groups_log (
	seq			INTEGER		PRIMARY KEY AUTOINCREMENT,
	action_name		TEXT		NOT NULL,
	command_id		TEXT		NOT NULL DEFAULT '',
	group_name		TEXT		NOT NULL
);
)sql";

}  // namespace schema
}  // namespace pgs

#endif  // PGS_SCHEMA_HPP_
