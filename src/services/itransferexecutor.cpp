/**
 * @file itransferexecutor.cpp
 * @brief Implementation file for the ITransferExecutor interface.
 *
 * The interface is pure virtual; this file gives MOC a translation unit
 * for its signals.
 */

#include "itransferexecutor.h"
