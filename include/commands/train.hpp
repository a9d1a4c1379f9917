#pragma once

int cmd_train(int argc, char** argv);
