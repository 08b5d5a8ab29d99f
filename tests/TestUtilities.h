#ifndef TESTUTILITIES_H
#define TESTUTILITIES_H

//Qt includes
#include <QByteArray>
#include <QString>
#include <QStringList>

//Std includes
#include <ostream>

//Our includes
#include "LfsOid.h"

class TestUtilities
{
public:
    static bool writeFile(const QString& path, const QByteArray& contents);
    static int countFilesRecursively(const QString& rootPath);

    //Deterministic, non-repeating payload so distinct sizes give distinct oids
    static QByteArray payload(int size, char seed = 'a');
};

std::ostream& operator<<(std::ostream& os, const QStringList& list);
std::ostream& operator<<(std::ostream& os, const QString& string);
namespace QLfs {
std::ostream& operator<<(std::ostream& os, const LfsOid& oid);
}

#endif // TESTUTILITIES_H
