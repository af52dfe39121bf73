#pragma once

int cmd_extract(int argc, char** argv);
