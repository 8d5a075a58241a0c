#ifndef SFX_9bfee7cf_3083_4b15_a878_417ead8f4808_H
#define SFX_9bfee7cf_3083_4b15_a878_417ead8f4808_H

#include <QtTest/QtTest>

class StaticContainersTest : public QObject {
	Q_OBJECT

private slots:
	void test_vectorGrowAndClear();
	void test_vectorDestroysElements();
	void test_dequeWrapsAround();
	void test_dequeClear();
};

#endif
