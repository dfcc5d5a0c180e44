#include <QCoreApplication>
#include <QDebug>

#include "src/memory_race_harness.h"

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    qDebug() << "\n" << "memory race harness";
    return run_memory_race_harness();
}
