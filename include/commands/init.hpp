#pragma once

// pwf init [path] [--history]
int cmd_init(int argc, char** argv);
