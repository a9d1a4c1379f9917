#pragma once

int cmd_guess(int argc, char** argv);
