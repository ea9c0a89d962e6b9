#pragma once

int cmd_align(int argc, char** argv);
