#pragma once

int cmd_lines(int argc, char** argv);
